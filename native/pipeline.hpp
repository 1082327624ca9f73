/**
 * tcpgraph — Pipeline coordinator.
 * Capture thread -> bounded frame queue -> aggregation thread (classify,
 * size, accumulate, tick) -> bounded sample queue -> consumer.
 *
 * Threads:
 *   capture      blocking pcap reads, pushes frames, blocks when the queue is full
 *   aggregation  sole owner of the BandwidthAggregator; ticks on a steady clock
 * Shutdown: cancel() (or the duration limit, or a capture failure) makes the
 * aggregation thread interrupt and join the capture thread, drain the frame
 * queue, flush a final partial sample and close the sample queue.
 */

#ifndef TCPGRAPH_PIPELINE_HPP
#define TCPGRAPH_PIPELINE_HPP

#include "bandwidth.hpp"
#include "bounded_queue.hpp"
#include "capture.hpp"
#include "classifier.hpp"
#include "local_addresses.hpp"
#include "payload.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace tcpgraph {

/** Everything the front end hands us at start. */
struct PipelineConfig {
  std::string interface_name{kAnyInterface};
  std::string filter;
  bool payload_only{false};
  std::chrono::milliseconds update_interval{1000};
  size_t smoothing_window{3};
  std::chrono::milliseconds duration_limit{0};  // 0 = run until cancelled
  std::chrono::seconds history_span{300};
  UnknownPolicy unknown_policy{UnknownPolicy::kExclude};
  size_t frame_queue_capacity{4096};
  size_t sample_queue_capacity{64};
};

/** Empty string when valid, otherwise what is wrong. */
std::string validate_config(const PipelineConfig& config);

struct PipelineStats {
  uint64_t frames_processed{0};
  uint64_t inbound_bytes{0};
  uint64_t outbound_bytes{0};
  uint64_t unknown_bytes{0};
  uint64_t samples_emitted{0};
  uint64_t samples_dropped{0};  // evicted from the sample queue before being read
  double peak_inbound_bps{0.0};
  double peak_outbound_bps{0.0};
  CaptureStats capture;
};

/** Resolves the local address set for an interface selector; false = not found. */
using AddressResolver = std::function<bool(const std::string& selector, LocalAddressSet& out)>;

class Pipeline {
 public:
  /** Live capture with libpcap and getifaddrs-based address resolution. */
  Pipeline();
  Pipeline(std::unique_ptr<FrameSource> source, AddressResolver resolver);
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  /**
   * Resolve local addresses, open the source and start both threads.
   * Returns false on a setup error; see last_error_code().
   */
  bool start(const PipelineConfig& config);

  /** Request shutdown. Idempotent; only touches a lock-free atomic, so signal-handler safe. */
  void cancel() noexcept;

  /** Block for the next sample. False once the stream has ended. */
  bool next_sample(BandwidthSample& out);

  /** Like next_sample with a timeout. */
  PopResult next_sample_for(BandwidthSample& out, std::chrono::milliseconds timeout);

  /** Join both threads. Returns immediately if not started. */
  void wait();

  /** cancel() + wait(). */
  void stop();

  bool is_running() const { return running_; }

  /** Counters are live; capture stats and history are only complete after wait(). */
  PipelineStats stats() const;

  /** Aggregator state. Only safe to read after wait(). */
  const BandwidthAggregator* aggregator() const { return aggregator_.get(); }

  const LocalAddressSet& local_addresses() const { return local_; }
  LinkType link_type() const { return link_type_; }

  std::string last_error_code() const;
  std::string last_error_message() const;

 private:
  void run_aggregation();
  void process_frame(const CapturedFrame& frame);
  void emit(const BandwidthSample& sample);
  void shutdown(const char* reason);
  void set_error(const std::string& code, const std::string& message);

  std::unique_ptr<FrameSource> source_;
  AddressResolver resolver_;
  PipelineConfig config_;
  LocalAddressSet local_;
  LinkType link_type_{LinkType::kUnsupported};
  CountMode count_mode_{CountMode::kFullFrame};

  std::unique_ptr<FrameQueue> frames_;
  std::unique_ptr<BoundedQueue<BandwidthSample>> samples_;
  std::unique_ptr<BandwidthAggregator> aggregator_;
  std::thread aggregation_thread_;

  static_assert(ATOMIC_BOOL_LOCK_FREE == 2, "cancel() must be lock-free");
  std::atomic<bool> cancel_requested_{false};
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> frames_processed_{0};
  std::atomic<uint64_t> samples_emitted_{0};

  mutable std::mutex error_mutex_;
  std::string last_error_code_;
  std::string last_error_message_;
};

}  // namespace tcpgraph

#endif  // TCPGRAPH_PIPELINE_HPP
