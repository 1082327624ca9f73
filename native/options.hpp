/**
 * tcpgraph — Numeric option conversion.
 * Front-end numbers arrive as doubles; these reject NaN, infinities and
 * values outside a range before any integer conversion happens.
 */

#ifndef TCPGRAPH_OPTIONS_HPP
#define TCPGRAPH_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace tcpgraph {

/** Ten years. Keeps clock arithmetic on steady/system time points in range. */
constexpr int64_t kMaxOptionMilliseconds = 315360000000LL;
constexpr int64_t kMaxOptionSeconds = kMaxOptionMilliseconds / 1000;
/** Queue and window sizes. */
constexpr int64_t kMaxOptionCount = 0xffffffffLL;

/** Finite and within [min, max]; the fractional part is truncated. */
bool number_to_integer(double value, int64_t min, int64_t max, int64_t& out);

bool number_to_milliseconds(double value, std::chrono::milliseconds& out);
bool number_to_seconds(double value, std::chrono::seconds& out);
bool number_to_count(double value, size_t& out);

}  // namespace tcpgraph

#endif  // TCPGRAPH_OPTIONS_HPP
