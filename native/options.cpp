/**
 * tcpgraph — Numeric option conversion implementation.
 */

#include "options.hpp"
#include <cmath>

namespace tcpgraph {

bool number_to_integer(double value, int64_t min, int64_t max, int64_t& out) {
  if (!std::isfinite(value)) return false;
  double whole = std::trunc(value);
  // Exact while min and max fit in 53 bits.
  if (whole < static_cast<double>(min) || whole > static_cast<double>(max)) return false;
  out = static_cast<int64_t>(whole);
  return true;
}

bool number_to_milliseconds(double value, std::chrono::milliseconds& out) {
  int64_t v = 0;
  if (!number_to_integer(value, 0, kMaxOptionMilliseconds, v)) return false;
  out = std::chrono::milliseconds(v);
  return true;
}

bool number_to_seconds(double value, std::chrono::seconds& out) {
  int64_t v = 0;
  if (!number_to_integer(value, 0, kMaxOptionSeconds, v)) return false;
  out = std::chrono::seconds(v);
  return true;
}

bool number_to_count(double value, size_t& out) {
  int64_t v = 0;
  if (!number_to_integer(value, 0, kMaxOptionCount, v)) return false;
  out = static_cast<size_t>(v);
  return true;
}

}  // namespace tcpgraph
