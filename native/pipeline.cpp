/**
 * tcpgraph — Pipeline coordinator implementation.
 */

#include "pipeline.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdio>

namespace tcpgraph {

namespace {

// Upper bound on how long the aggregation thread sleeps before re-checking
// the cancel flag (cancel() cannot notify a condition variable).
constexpr std::chrono::milliseconds kCancelPoll{50};

}  // namespace

std::string validate_config(const PipelineConfig& config) {
  if (config.interface_name.empty()) return "interface name cannot be empty";
  if (config.filter.empty()) return "filter expression cannot be empty";
  if (config.update_interval.count() <= 0) return "update interval must be greater than 0";
  if (config.smoothing_window == 0) return "smoothing window must be at least 1";
  if (config.duration_limit.count() < 0) return "duration cannot be negative";
  if (config.history_span.count() <= 0) return "history span must be greater than 0";
  if (config.frame_queue_capacity == 0) return "frame queue capacity must be greater than 0";
  if (config.sample_queue_capacity == 0) return "sample queue capacity must be greater than 0";
  return std::string();
}

Pipeline::Pipeline()
    : Pipeline(std::unique_ptr<FrameSource>(new CaptureEngine()), resolve_local_addresses) {}

Pipeline::Pipeline(std::unique_ptr<FrameSource> source, AddressResolver resolver)
    : source_(std::move(source)), resolver_(std::move(resolver)) {}

Pipeline::~Pipeline() {
  stop();
}

void Pipeline::set_error(const std::string& code, const std::string& message) {
  std::lock_guard<std::mutex> lock(error_mutex_);
  last_error_code_ = code;
  last_error_message_ = message;
}

std::string Pipeline::last_error_code() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_code_;
}

std::string Pipeline::last_error_message() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_message_;
}

bool Pipeline::start(const PipelineConfig& config) {
  if (running_) {
    set_error(error_code::kAlreadyRunning, "pipeline already running");
    return false;
  }
  wait();  // reap a previous run that ended on its own
  set_error("", "");

  std::string invalid = validate_config(config);
  if (!invalid.empty()) {
    set_error(error_code::kInvalidConfig, invalid);
    return false;
  }
  config_ = config;
  count_mode_ = config_.payload_only ? CountMode::kPayloadOnly : CountMode::kFullFrame;

  LocalAddressSet local;
  if (!resolver_(config_.interface_name, local)) {
    set_error(error_code::kInterfaceNotFound, "interface '" + config_.interface_name + "' not found");
    return false;
  }
  local_ = std::move(local);
  if (local_.empty()) {
    fprintf(stderr, "[tcpgraph] empty_local_address_set interface=%s direction=unknown_only\n",
            config_.interface_name.c_str());
  }

  AggregatorConfig agg;
  agg.interval = config_.update_interval;
  agg.smoothing_window = config_.smoothing_window;
  agg.history_span = config_.history_span;
  agg.unknown_policy = config_.unknown_policy;
  aggregator_.reset(new BandwidthAggregator(agg));
  frames_.reset(new FrameQueue(config_.frame_queue_capacity));
  samples_.reset(new BoundedQueue<BandwidthSample>(config_.sample_queue_capacity));
  frames_processed_ = 0;
  samples_emitted_ = 0;
  cancel_requested_ = false;

  CaptureConfig cap;
  cap.interface_name = config_.interface_name;
  cap.filter = config_.filter;
  cap.payload_only = config_.payload_only;
  bool ok = source_->start(cap, *frames_, [this](const std::string& code, const std::string& message) {
    fprintf(stderr, "[tcpgraph] capture_failed code=%s message=%s\n", code.c_str(), message.c_str());
    set_error(code, message);
    cancel();
  });
  if (!ok) {
    set_error(source_->last_error_code(), source_->last_error_message());
    samples_->close();
    return false;
  }
  link_type_ = source_->link_type();

  running_ = true;
  aggregation_thread_ = std::thread(&Pipeline::run_aggregation, this);
  return true;
}

void Pipeline::cancel() noexcept {
  cancel_requested_.store(true);
}

void Pipeline::process_frame(const CapturedFrame& frame) {
  const uint8_t* data = frame.data.data();
  ByteSample sample;
  sample.direction = classify_direction(data, frame.caplen, link_type_, local_);
  sample.bytes = frame_byte_count(data, frame.caplen, link_type_, count_mode_);
  sample.timestamp = frame.timestamp;
  aggregator_->accumulate(sample);
  frames_processed_++;
}

void Pipeline::emit(const BandwidthSample& sample) {
  // Drop-oldest: a slow consumer must never stall the tick.
  if (samples_->push_drop_oldest(sample)) samples_emitted_++;
}

void Pipeline::run_aggregation() {
  using clock = std::chrono::steady_clock;
  const auto interval = config_.update_interval;
  const auto started = clock::now();
  const auto end = config_.duration_limit.count() > 0 ? started + config_.duration_limit
                                                        : clock::time_point::max();
  auto next_tick = started + interval;
  const char* reason = "cancelled";

  CapturedFrame frame;
  while (true) {
    if (cancel_requested_.load()) break;
    auto now = clock::now();
    // A tick due at or before the end still belongs to the run.
    if (now >= next_tick && next_tick <= end) {
      emit(aggregator_->tick(std::chrono::system_clock::now()));
      next_tick += interval;
      // Fell more than a whole interval behind (suspend, debugger): resync.
      if (next_tick + interval < now) next_tick = now + interval;
      continue;
    }
    if (now >= end) {
      reason = "duration_elapsed";
      break;
    }
    auto wake = std::min(std::min(next_tick, end), now + kCancelPoll);
    PopResult r = frames_->pop_until(frame, wake);
    if (r == PopResult::kItem) {
      process_frame(frame);
    } else if (r == PopResult::kClosed) {
      reason = "source_closed";
      break;
    }
  }
  shutdown(reason);
}

void Pipeline::shutdown(const char* reason) {
  // Close first so a producer blocked on a full queue wakes up, then unblock the read.
  frames_->close();
  source_->stop();

  CapturedFrame frame;
  while (frames_->pop(frame) == PopResult::kItem) process_frame(frame);

  BandwidthSample last;
  if (aggregator_->flush(std::chrono::system_clock::now(), last)) emit(last);
  samples_->close();

  fprintf(stderr, "[tcpgraph] pipeline_stopped reason=%s frames=%llu samples=%llu\n", reason,
          static_cast<unsigned long long>(frames_processed_.load()),
          static_cast<unsigned long long>(samples_emitted_.load()));
  running_ = false;
}

bool Pipeline::next_sample(BandwidthSample& out) {
  if (!samples_) return false;
  return samples_->pop(out) == PopResult::kItem;
}

PopResult Pipeline::next_sample_for(BandwidthSample& out, std::chrono::milliseconds timeout) {
  if (!samples_) return PopResult::kClosed;
  return samples_->pop_for(out, timeout);
}

void Pipeline::wait() {
  if (aggregation_thread_.joinable()) aggregation_thread_.join();
  if (source_) source_->stop();
}

void Pipeline::stop() {
  cancel();
  wait();
}

PipelineStats Pipeline::stats() const {
  PipelineStats s;
  s.frames_processed = frames_processed_;
  s.samples_emitted = samples_emitted_;
  if (samples_) s.samples_dropped = samples_->dropped();
  if (!running_ && aggregator_) {
    s.inbound_bytes = aggregator_->total_inbound_bytes();
    s.outbound_bytes = aggregator_->total_outbound_bytes();
    s.unknown_bytes = aggregator_->total_unknown_bytes();
    s.peak_inbound_bps = aggregator_->history().max_inbound_bps();
    s.peak_outbound_bps = aggregator_->history().max_outbound_bps();
  }
  if (!running_ && source_) s.capture = source_->stats();
  return s;
}

}  // namespace tcpgraph
