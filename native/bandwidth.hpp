/**
 * tcpgraph — Bandwidth aggregation.
 * Per-tick byte counters -> raw bits/s -> smoothing window mean -> emitted
 * sample, kept in a time-bounded history with session peaks.
 * Not thread-safe: owned by the aggregation thread only.
 */

#ifndef TCPGRAPH_BANDWIDTH_HPP
#define TCPGRAPH_BANDWIDTH_HPP

#include "classifier.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>

namespace tcpgraph {

/** How bytes of Unknown-direction frames reach the inbound/outbound pair. */
enum class UnknownPolicy {
  kExclude,  // neither direction; reported only as unknown_bps
  kSplit,    // half to each direction, odd byte inbound
};

const char* unknown_policy_name(UnknownPolicy policy);

/** Per-frame result of classification + sizing. */
struct ByteSample {
  Direction direction{Direction::kUnknown};
  uint64_t bytes{0};
  std::chrono::system_clock::time_point timestamp{};
};

/** One point of the emitted series. All rates are bits per second. */
struct BandwidthSample {
  double inbound_bps{0.0};  // smoothed
  double outbound_bps{0.0};  // smoothed
  double raw_inbound_bps{0.0};
  double raw_outbound_bps{0.0};
  double unknown_bps{0.0};  // raw, regardless of policy
  double peak_inbound_bps{0.0};
  double peak_outbound_bps{0.0};
  std::chrono::system_clock::time_point timestamp{};
  bool final_sample{false};  // partial interval flushed at shutdown
};

/** Fixed-capacity FIFO of raw (inbound, outbound) rate pairs. */
class SmoothingWindow {
 public:
  explicit SmoothingWindow(size_t capacity);

  void push(double inbound_bps, double outbound_bps);

  /** Mean over what is present now (ramps 1..N, no zero padding). 0 when empty. */
  double mean_inbound() const;
  double mean_outbound() const;

  size_t size() const { return entries_.size(); }
  size_t capacity() const { return capacity_; }

 private:
  size_t capacity_;
  std::deque<std::pair<double, double>> entries_;
};

/**
 * Samples no older than span relative to the newest one, and none stamped
 * later than it. Peaks cover the whole session and survive eviction.
 */
class BandwidthHistory {
 public:
  explicit BandwidthHistory(std::chrono::seconds span);

  void append(const BandwidthSample& sample);

  const std::deque<BandwidthSample>& samples() const { return samples_; }
  std::chrono::seconds span() const { return span_; }
  double max_inbound_bps() const { return max_inbound_bps_; }
  double max_outbound_bps() const { return max_outbound_bps_; }

 private:
  std::chrono::seconds span_;
  std::deque<BandwidthSample> samples_;
  double max_inbound_bps_{0.0};
  double max_outbound_bps_{0.0};
};

struct AggregatorConfig {
  std::chrono::milliseconds interval{1000};
  size_t smoothing_window{3};
  std::chrono::seconds history_span{300};
  UnknownPolicy unknown_policy{UnknownPolicy::kExclude};
};

class BandwidthAggregator {
 public:
  /** Throws std::invalid_argument on a non-positive interval, window or span. */
  explicit BandwidthAggregator(AggregatorConfig config);

  /** Add one classified frame to the current interval. */
  void accumulate(const ByteSample& sample);

  /** Close the current interval: compute rates, smooth, record, reset counters. */
  BandwidthSample tick(std::chrono::system_clock::time_point now);

  /** Bytes accumulated since the last tick (any direction). */
  bool has_pending() const;

  /**
   * Shutdown helper: if the partial interval holds bytes, close it like a
   * normal tick, mark it final and return true.
   */
  bool flush(std::chrono::system_clock::time_point now, BandwidthSample& out);

  const AggregatorConfig& config() const { return config_; }
  const SmoothingWindow& window() const { return window_; }
  const BandwidthHistory& history() const { return history_; }

  uint64_t frames_accumulated() const { return frames_; }
  uint64_t total_inbound_bytes() const { return total_inbound_; }
  uint64_t total_outbound_bytes() const { return total_outbound_; }
  uint64_t total_unknown_bytes() const { return total_unknown_; }

 private:
  double to_bps(uint64_t bytes) const;

  AggregatorConfig config_;
  SmoothingWindow window_;
  BandwidthHistory history_;
  uint64_t inbound_bytes_{0};
  uint64_t outbound_bytes_{0};
  uint64_t unknown_bytes_{0};
  uint64_t frames_{0};
  uint64_t total_inbound_{0};
  uint64_t total_outbound_{0};
  uint64_t total_unknown_{0};
};

}  // namespace tcpgraph

#endif  // TCPGRAPH_BANDWIDTH_HPP
