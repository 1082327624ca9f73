/**
 * tcpgraph — Capture layer.
 * libpcap open, user filter, blocking read loop on its own thread feeding the
 * bounded frame queue.
 */

#ifndef TCPGRAPH_CAPTURE_HPP
#define TCPGRAPH_CAPTURE_HPP

#include "bounded_queue.hpp"
#include "packet.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <thread>

struct pcap;
struct bpf_program;

namespace tcpgraph {

using FrameQueue = BoundedQueue<CapturedFrame>;

/** Subset of the pipeline config the capture handle needs. */
struct CaptureConfig {
  std::string interface_name;
  std::string filter;
  int snaplen{65535};
  bool promiscuous{true};
  int read_timeout_ms{1000};
  bool payload_only{false};  // only reported in the startup line
};

/** Fatal error raised from the capture thread after a successful start. */
using ErrorCallback = std::function<void(const std::string& code, const std::string& message)>;

/** pcap_stats counters. Only valid after stop() on a handle that was open. */
struct CaptureStats {
  unsigned int received{0};
  unsigned int dropped{0};
  unsigned int if_dropped{0};
  bool valid{false};
};

/**
 * Producer side of the pipeline. start() opens the source and begins pushing
 * frames from a dedicated thread; stop() must unblock that thread, join it
 * and release the source. stop() is idempotent.
 */
class FrameSource {
 public:
  virtual ~FrameSource() = default;

  /** Returns false on a setup error; see last_error_code(). */
  virtual bool start(const CaptureConfig& config, FrameQueue& queue, ErrorCallback on_error) = 0;
  virtual void stop() = 0;
  virtual bool is_running() const = 0;
  /** Datalink of the opened source. */
  virtual LinkType link_type() const = 0;
  virtual CaptureStats stats() const = 0;
  virtual std::string last_error_code() const = 0;
  virtual std::string last_error_message() const = 0;
};

/**
 * Live capture via libpcap.
 * Thread: start() begins a capture thread; stop() breaks the loop and joins.
 * Producer blocks when the frame queue is full (kernel-side drops are then
 * visible in CaptureStats::dropped).
 */
class CaptureEngine : public FrameSource {
 public:
  CaptureEngine();
  ~CaptureEngine() override;

  CaptureEngine(const CaptureEngine&) = delete;
  CaptureEngine& operator=(const CaptureEngine&) = delete;

  bool start(const CaptureConfig& config, FrameQueue& queue, ErrorCallback on_error) override;
  void stop() override;
  bool is_running() const override { return running_; }
  LinkType link_type() const override { return link_type_; }
  CaptureStats stats() const override { return last_stats_; }
  std::string last_error_code() const override { return last_error_code_; }
  std::string last_error_message() const override { return last_error_message_; }

 private:
  void run_loop();
  bool fail_setup(const std::string& code, const std::string& message);
  void report_error(const std::string& code, const std::string& message);
  void close_handle();

  pcap* pcap_handle_{nullptr};
  bpf_program* bpf_program_{nullptr};
  CaptureConfig config_;
  FrameQueue* queue_{nullptr};
  ErrorCallback on_error_;
  LinkType link_type_{LinkType::kUnsupported};
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::thread capture_thread_;
  std::string last_error_code_;
  std::string last_error_message_;
  CaptureStats last_stats_;
};

}  // namespace tcpgraph

#endif  // TCPGRAPH_CAPTURE_HPP
