/**
 * tcpgraph — Sample forwarder implementation.
 */

#include "forwarder.hpp"
#include <chrono>
#include <cstdio>

namespace tcpgraph {

namespace {

constexpr std::chrono::milliseconds kEndMarkerRetry{10};

}  // namespace

SampleForwarder::~SampleForwarder() {
  stop();
}

bool SampleForwarder::start(Pipeline& pipeline, SampleSink sink, std::function<void()> on_exit) {
  if (thread_.joinable()) return false;
  pipeline_ = &pipeline;
  sink_ = std::move(sink);
  on_exit_ = std::move(on_exit);
  stopping_ = false;
  delivered_ = 0;
  dropped_ = 0;
  end_delivered_ = false;
  thread_ = std::thread(&SampleForwarder::run, this);
  return true;
}

void SampleForwarder::run() {
  bool closed = false;
  BandwidthSample sample;
  while (pipeline_->next_sample(sample)) {
    DeliveryResult r = sink_(&sample);
    if (r == DeliveryResult::kDelivered) {
      delivered_++;
    } else if (r == DeliveryResult::kFull) {
      dropped_++;
    } else {
      closed = true;
      break;
    }
  }

  if (!closed) {
    // The end marker is worth waiting for unless we are being torn down.
    while (true) {
      DeliveryResult r = sink_(nullptr);
      if (r == DeliveryResult::kDelivered) end_delivered_ = true;
      if (r != DeliveryResult::kFull || stopping_) break;
      std::this_thread::sleep_for(kEndMarkerRetry);
    }
  }
  if (dropped_ > 0) {
    fprintf(stderr, "[tcpgraph] forwarder_dropped samples=%llu\n",
            static_cast<unsigned long long>(dropped_.load()));
  }
  if (on_exit_) on_exit_();
}

void SampleForwarder::wait() {
  if (thread_.joinable()) thread_.join();
}

void SampleForwarder::stop() {
  stopping_ = true;
  if (thread_.joinable() && pipeline_ != nullptr) pipeline_->cancel();
  wait();
}

}  // namespace tcpgraph
