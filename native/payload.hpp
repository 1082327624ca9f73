/**
 * tcpgraph — Payload extractor.
 * Byte count attributed to one frame: whole captured frame, or only the
 * application payload behind the IP and TCP/UDP headers.
 */

#ifndef TCPGRAPH_PAYLOAD_HPP
#define TCPGRAPH_PAYLOAD_HPP

#include "packet.hpp"
#include <cstddef>
#include <cstdint>

namespace tcpgraph {

enum class CountMode {
  kFullFrame,
  kPayloadOnly,
};

/**
 * Bytes to account for this frame. In payload-only mode any unrecognized
 * link/network type or malformed header falls back to caplen.
 */
uint32_t frame_byte_count(const uint8_t* data, uint32_t caplen, LinkType link_type,
                          CountMode mode);

}  // namespace tcpgraph

#endif  // TCPGRAPH_PAYLOAD_HPP
