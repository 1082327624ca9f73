/**
 * tcpgraph — Bandwidth aggregation implementation.
 */

#include "bandwidth.hpp"
#include <algorithm>
#include <stdexcept>

namespace tcpgraph {

const char* unknown_policy_name(UnknownPolicy policy) {
  return policy == UnknownPolicy::kSplit ? "split" : "exclude";
}

SmoothingWindow::SmoothingWindow(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) throw std::invalid_argument("smoothing window size must be >= 1");
}

void SmoothingWindow::push(double inbound_bps, double outbound_bps) {
  entries_.emplace_back(inbound_bps, outbound_bps);
  while (entries_.size() > capacity_) entries_.pop_front();
}

double SmoothingWindow::mean_inbound() const {
  if (entries_.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& e : entries_) sum += e.first;
  return sum / static_cast<double>(entries_.size());
}

double SmoothingWindow::mean_outbound() const {
  if (entries_.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& e : entries_) sum += e.second;
  return sum / static_cast<double>(entries_.size());
}

BandwidthHistory::BandwidthHistory(std::chrono::seconds span) : span_(span) {
  if (span_.count() <= 0) throw std::invalid_argument("history span must be > 0");
}

void BandwidthHistory::append(const BandwidthSample& sample) {
  samples_.push_back(sample);
  if (sample.inbound_bps > max_inbound_bps_) max_inbound_bps_ = sample.inbound_bps;
  if (sample.outbound_bps > max_outbound_bps_) max_outbound_bps_ = sample.outbound_bps;
  // Entries stamped after the newest one predate a backwards wall-clock step.
  const auto newest = sample.timestamp;
  const auto cutoff = newest - span_;
  samples_.erase(std::remove_if(samples_.begin(), samples_.end(),
                                [&](const BandwidthSample& s) {
                                  return s.timestamp < cutoff || s.timestamp > newest;
                                }),
                 samples_.end());
}

BandwidthAggregator::BandwidthAggregator(AggregatorConfig config)
    : config_(config),
      window_(config.smoothing_window),
      history_(config.history_span) {
  if (config_.interval.count() <= 0) throw std::invalid_argument("update interval must be > 0");
}

void BandwidthAggregator::accumulate(const ByteSample& sample) {
  frames_++;
  switch (sample.direction) {
    case Direction::kInbound:
      inbound_bytes_ += sample.bytes;
      total_inbound_ += sample.bytes;
      break;
    case Direction::kOutbound:
      outbound_bytes_ += sample.bytes;
      total_outbound_ += sample.bytes;
      break;
    case Direction::kUnknown:
      unknown_bytes_ += sample.bytes;
      total_unknown_ += sample.bytes;
      if (config_.unknown_policy == UnknownPolicy::kSplit) {
        inbound_bytes_ += (sample.bytes + 1) / 2;
        outbound_bytes_ += sample.bytes / 2;
      }
      break;
  }
}

double BandwidthAggregator::to_bps(uint64_t bytes) const {
  const double seconds = std::chrono::duration<double>(config_.interval).count();
  return static_cast<double>(bytes) * 8.0 / seconds;
}

BandwidthSample BandwidthAggregator::tick(std::chrono::system_clock::time_point now) {
  BandwidthSample sample;
  sample.timestamp = now;
  sample.raw_inbound_bps = to_bps(inbound_bytes_);
  sample.raw_outbound_bps = to_bps(outbound_bytes_);
  sample.unknown_bps = to_bps(unknown_bytes_);
  inbound_bytes_ = 0;
  outbound_bytes_ = 0;
  unknown_bytes_ = 0;

  window_.push(sample.raw_inbound_bps, sample.raw_outbound_bps);
  sample.inbound_bps = window_.mean_inbound();
  sample.outbound_bps = window_.mean_outbound();

  sample.peak_inbound_bps = std::max(history_.max_inbound_bps(), sample.inbound_bps);
  sample.peak_outbound_bps = std::max(history_.max_outbound_bps(), sample.outbound_bps);
  history_.append(sample);
  return sample;
}

bool BandwidthAggregator::has_pending() const {
  return inbound_bytes_ != 0 || outbound_bytes_ != 0 || unknown_bytes_ != 0;
}

bool BandwidthAggregator::flush(std::chrono::system_clock::time_point now, BandwidthSample& out) {
  if (!has_pending()) return false;
  out = tick(now);
  out.final_sample = true;
  return true;
}

}  // namespace tcpgraph
