/**
 * tcpgraph — Setup error codes.
 * Reported through last_error_code() on Pipeline / CaptureEngine and as the
 * `code` property of errors thrown by the Node-API layer.
 */

#ifndef TCPGRAPH_ERRORS_HPP
#define TCPGRAPH_ERRORS_HPP

namespace tcpgraph {
namespace error_code {

inline constexpr const char* kInterfaceNotFound = "INTERFACE_NOT_FOUND";
inline constexpr const char* kFilterInvalid = "FILTER_INVALID";
inline constexpr const char* kPermissionDenied = "PERMISSION_DENIED";
inline constexpr const char* kCaptureOpenFailed = "CAPTURE_OPEN_FAILED";
inline constexpr const char* kInvalidConfig = "INVALID_CONFIG";
inline constexpr const char* kAlreadyRunning = "ALREADY_RUNNING";
// Runtime, after a successful start: the capture read loop failed.
inline constexpr const char* kCaptureFailed = "CAPTURE_FAILED";

}  // namespace error_code
}  // namespace tcpgraph

#endif  // TCPGRAPH_ERRORS_HPP
