/**
 * tcpgraph — Sample forwarder.
 * Drains a running Pipeline on its own thread and hands each sample to a
 * bounded, non-blocking sink (the addon's ThreadSafeFunction). A full sink
 * drops the sample and counts it; a closed sink ends forwarding. A null
 * sample marks the end of the stream.
 */

#ifndef TCPGRAPH_FORWARDER_HPP
#define TCPGRAPH_FORWARDER_HPP

#include "pipeline.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <thread>

namespace tcpgraph {

enum class DeliveryResult {
  kDelivered,
  kFull,
  kClosed,  // receiver gone, stop forwarding
};

/** nullptr = end of stream. Must not block. */
using SampleSink = std::function<DeliveryResult(const BandwidthSample* sample)>;

class SampleForwarder {
 public:
  SampleForwarder() = default;
  ~SampleForwarder();

  SampleForwarder(const SampleForwarder&) = delete;
  SampleForwarder& operator=(const SampleForwarder&) = delete;

  /**
   * Start forwarding from pipeline (already started). on_exit runs on the
   * forwarder thread after the last delivery attempt. False if still running.
   */
  bool start(Pipeline& pipeline, SampleSink sink, std::function<void()> on_exit = nullptr);

  /** Join once the stream ends on its own. */
  void wait();

  /**
   * Cancel the pipeline and join. The end marker gets a single delivery
   * attempt instead of being retried. Idempotent.
   */
  void stop();

  bool joinable() const { return thread_.joinable(); }
  uint64_t delivered() const { return delivered_; }
  uint64_t dropped() const { return dropped_; }
  bool end_delivered() const { return end_delivered_; }

 private:
  void run();

  Pipeline* pipeline_{nullptr};
  SampleSink sink_;
  std::function<void()> on_exit_;
  std::thread thread_;
  std::atomic<bool> stopping_{false};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<bool> end_delivered_{false};
};

}  // namespace tcpgraph

#endif  // TCPGRAPH_FORWARDER_HPP
