#include "errors.hpp"
#include "frame_builder.hpp"
#include "pipeline.hpp"
#include "scripted_source.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <vector>

using namespace tcpgraph;
using namespace tcpgraph::testing;
using std::chrono::milliseconds;

namespace {

AddressResolver fixed_resolver(LocalAddressSet set) {
  return [set](const std::string& selector, LocalAddressSet& out) {
    if (selector == "missing0") return false;
    out = set;
    return true;
  };
}

PipelineConfig config_with(milliseconds interval) {
  PipelineConfig c;
  c.interface_name = "eth0";
  c.filter = "tcp";
  c.update_interval = interval;
  return c;
}

struct Harness {
  explicit Harness(std::vector<CapturedFrame> frames, LocalAddressSet local = LocalAddressSet{kLocalMac}) {
    auto src = std::unique_ptr<ScriptedFrameSource>(new ScriptedFrameSource(std::move(frames)));
    source = src.get();
    pipeline.reset(new Pipeline(std::move(src), fixed_resolver(local)));
  }
  ScriptedFrameSource* source{nullptr};
  std::unique_ptr<Pipeline> pipeline;
};

bool wait_for_frames(const Pipeline& p, uint64_t n) {
  for (int i = 0; i < 500; i++) {
    if (p.stats().frames_processed >= n) return true;
    std::this_thread::sleep_for(milliseconds(2));
  }
  return false;
}

std::vector<BandwidthSample> drain(Pipeline& p) {
  std::vector<BandwidthSample> out;
  BandwidthSample s;
  while (p.next_sample(s)) out.push_back(s);
  return out;
}

}  // namespace

TEST(Pipeline, SingleInboundFrameWithinOneSecondTick) {
  Harness h({captured(sized_frame(kLocalMac, kRemoteMac, 1500))});
  ASSERT_TRUE(h.pipeline->start(config_with(milliseconds(1000))));

  BandwidthSample s;
  ASSERT_EQ(h.pipeline->next_sample_for(s, milliseconds(5000)), PopResult::kItem);
  EXPECT_DOUBLE_EQ(s.raw_inbound_bps, 12000.0);
  EXPECT_DOUBLE_EQ(s.inbound_bps, 12000.0);
  EXPECT_DOUBLE_EQ(s.outbound_bps, 0.0);
  EXPECT_FALSE(s.final_sample);

  h.pipeline->stop();
  EXPECT_FALSE(h.pipeline->is_running());
  PipelineStats st = h.pipeline->stats();
  EXPECT_EQ(st.frames_processed, 1u);
  EXPECT_EQ(st.inbound_bytes, 1500u);
  EXPECT_DOUBLE_EQ(st.peak_inbound_bps, 12000.0);
}

TEST(Pipeline, PassesInterfaceAndFilterToSource) {
  Harness h({});
  PipelineConfig c = config_with(milliseconds(100));
  c.filter = "udp port 53";
  c.payload_only = true;
  ASSERT_TRUE(h.pipeline->start(c));
  h.pipeline->stop();
  EXPECT_EQ(h.source->config().interface_name, "eth0");
  EXPECT_EQ(h.source->config().filter, "udp port 53");
  EXPECT_TRUE(h.source->config().payload_only);
}

TEST(Pipeline, PayloadOnlyModeCountsApplicationBytes) {
  Bytes frame = ethernet(kRemoteMac, kLocalMac, kEtherTypeIpv4, ipv4(kProtoTcp, 100, 5, tcp(5, 60)));
  Harness h({captured(frame)});
  PipelineConfig c = config_with(milliseconds(10000));
  c.payload_only = true;
  ASSERT_TRUE(h.pipeline->start(c));
  ASSERT_TRUE(wait_for_frames(*h.pipeline, 1));
  h.pipeline->stop();
  EXPECT_EQ(h.pipeline->stats().outbound_bytes, 60u);
}

TEST(Pipeline, CancelFlushesPartialIntervalOnce) {
  Harness h({captured(sized_frame(kRemoteMac, kLocalMac, 1000))});
  ASSERT_TRUE(h.pipeline->start(config_with(milliseconds(10000))));
  ASSERT_TRUE(wait_for_frames(*h.pipeline, 1));

  h.pipeline->cancel();
  h.pipeline->cancel();
  std::vector<BandwidthSample> samples = drain(*h.pipeline);
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_TRUE(samples[0].final_sample);
  EXPECT_DOUBLE_EQ(samples[0].raw_outbound_bps, 800.0);  // 1000 B * 8 / 10 s

  h.pipeline->wait();
  h.pipeline->stop();
  EXPECT_FALSE(h.pipeline->is_running());
  EXPECT_GE(h.source->stop_calls(), 1);
}

TEST(Pipeline, CancelWithoutTrafficEmitsNothing) {
  Harness h({});
  ASSERT_TRUE(h.pipeline->start(config_with(milliseconds(10000))));
  h.pipeline->cancel();
  EXPECT_TRUE(drain(*h.pipeline).empty());
  h.pipeline->wait();
}

TEST(Pipeline, DurationLimitEndsStreamWithZeroTicks) {
  Harness h({});
  PipelineConfig c = config_with(milliseconds(100));
  c.duration_limit = milliseconds(350);
  ASSERT_TRUE(h.pipeline->start(c));

  std::vector<BandwidthSample> samples = drain(*h.pipeline);
  h.pipeline->wait();
  EXPECT_EQ(samples.size(), 3u);
  for (const auto& s : samples) {
    EXPECT_DOUBLE_EQ(s.inbound_bps, 0.0);
    EXPECT_DOUBLE_EQ(s.outbound_bps, 0.0);
    EXPECT_FALSE(s.final_sample);
  }
  EXPECT_FALSE(h.pipeline->is_running());
}

TEST(Pipeline, DurationOnIntervalBoundaryKeepsLastTick) {
  Harness h({captured(sized_frame(kLocalMac, kRemoteMac, 100))});
  PipelineConfig c = config_with(milliseconds(100));
  c.duration_limit = milliseconds(300);
  ASSERT_TRUE(h.pipeline->start(c));

  std::vector<BandwidthSample> samples = drain(*h.pipeline);
  h.pipeline->wait();
  ASSERT_EQ(samples.size(), 3u);
  EXPECT_DOUBLE_EQ(samples[0].raw_inbound_bps, 8000.0);
  EXPECT_DOUBLE_EQ(samples[2].raw_inbound_bps, 0.0);
  EXPECT_FALSE(samples[2].final_sample);
}

TEST(Pipeline, TransitTrafficReportedAsUnknown) {
  Harness h({captured(sized_frame(kOtherRemoteMac, kRemoteMac, 500))});
  ASSERT_TRUE(h.pipeline->start(config_with(milliseconds(10000))));
  ASSERT_TRUE(wait_for_frames(*h.pipeline, 1));
  h.pipeline->cancel();
  std::vector<BandwidthSample> samples = drain(*h.pipeline);
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_DOUBLE_EQ(samples[0].raw_inbound_bps, 0.0);
  EXPECT_DOUBLE_EQ(samples[0].raw_outbound_bps, 0.0);
  EXPECT_DOUBLE_EQ(samples[0].unknown_bps, 400.0);
}

TEST(Pipeline, SplitPolicyAppliesToTransitTraffic) {
  Harness h({captured(sized_frame(kOtherRemoteMac, kRemoteMac, 500))});
  PipelineConfig c = config_with(milliseconds(10000));
  c.unknown_policy = UnknownPolicy::kSplit;
  ASSERT_TRUE(h.pipeline->start(c));
  ASSERT_TRUE(wait_for_frames(*h.pipeline, 1));
  h.pipeline->cancel();
  std::vector<BandwidthSample> samples = drain(*h.pipeline);
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_DOUBLE_EQ(samples[0].raw_inbound_bps, 200.0);
  EXPECT_DOUBLE_EQ(samples[0].raw_outbound_bps, 200.0);
}

TEST(Pipeline, FrameQueueSaturationLosesNothing) {
  // Producer blocks on the 4-slot queue instead of dropping.
  std::vector<CapturedFrame> frames;
  for (int i = 0; i < 500; i++) frames.push_back(captured(sized_frame(kLocalMac, kRemoteMac, 100)));
  Harness h(std::move(frames));
  PipelineConfig c = config_with(milliseconds(10000));
  c.frame_queue_capacity = 4;
  ASSERT_TRUE(h.pipeline->start(c));
  ASSERT_TRUE(wait_for_frames(*h.pipeline, 500));
  h.pipeline->stop();
  EXPECT_EQ(h.source->pushed(), 500u);
  EXPECT_EQ(h.pipeline->stats().inbound_bytes, 50000u);
}

TEST(Pipeline, SlowConsumerDropsOldestSamples) {
  Harness h({});
  PipelineConfig c = config_with(milliseconds(20));
  c.sample_queue_capacity = 2;
  ASSERT_TRUE(h.pipeline->start(c));
  std::this_thread::sleep_for(milliseconds(300));
  h.pipeline->stop();

  PipelineStats st = h.pipeline->stats();
  std::vector<BandwidthSample> samples = drain(*h.pipeline);
  EXPECT_LE(samples.size(), 2u);
  EXPECT_GT(st.samples_dropped, 0u);
  EXPECT_EQ(st.samples_emitted, st.samples_dropped + samples.size());
}

TEST(Pipeline, CaptureFailureEndsStream) {
  Harness h({captured(sized_frame(kLocalMac, kRemoteMac, 200))});
  h.source->fail_after_frames(error_code::kCaptureFailed);
  ASSERT_TRUE(h.pipeline->start(config_with(milliseconds(10000))));
  std::vector<BandwidthSample> samples = drain(*h.pipeline);
  h.pipeline->wait();
  EXPECT_EQ(h.pipeline->last_error_code(), error_code::kCaptureFailed);
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_TRUE(samples[0].final_sample);
}

TEST(Pipeline, UnknownInterfaceFailsAtStart) {
  Harness h({});
  PipelineConfig c = config_with(milliseconds(100));
  c.interface_name = "missing0";
  EXPECT_FALSE(h.pipeline->start(c));
  EXPECT_EQ(h.pipeline->last_error_code(), error_code::kInterfaceNotFound);
  EXPECT_FALSE(h.pipeline->is_running());
  BandwidthSample s;
  EXPECT_FALSE(h.pipeline->next_sample(s));
}

TEST(Pipeline, SourceSetupErrorsPropagate) {
  Harness h({});
  h.source->fail_start(error_code::kFilterInvalid, "pcap_compile: syntax error");
  EXPECT_FALSE(h.pipeline->start(config_with(milliseconds(100))));
  EXPECT_EQ(h.pipeline->last_error_code(), error_code::kFilterInvalid);
  EXPECT_EQ(h.pipeline->last_error_message(), "pcap_compile: syntax error");
  BandwidthSample s;
  EXPECT_FALSE(h.pipeline->next_sample(s));

  Harness p({});
  p.source->fail_start(error_code::kPermissionDenied, "you don't have permission");
  EXPECT_FALSE(p.pipeline->start(config_with(milliseconds(100))));
  EXPECT_EQ(p.pipeline->last_error_code(), error_code::kPermissionDenied);
}

TEST(Pipeline, InvalidConfigRejected) {
  Harness h({});
  PipelineConfig c = config_with(milliseconds(0));
  EXPECT_FALSE(h.pipeline->start(c));
  EXPECT_EQ(h.pipeline->last_error_code(), error_code::kInvalidConfig);

  c = config_with(milliseconds(100));
  c.smoothing_window = 0;
  EXPECT_FALSE(h.pipeline->start(c));
  c = config_with(milliseconds(100));
  c.filter.clear();
  EXPECT_FALSE(h.pipeline->start(c));
  EXPECT_EQ(h.pipeline->last_error_message(), "filter expression cannot be empty");
}

TEST(Pipeline, SecondStartWhileRunningRejected) {
  Harness h({});
  ASSERT_TRUE(h.pipeline->start(config_with(milliseconds(1000))));
  EXPECT_FALSE(h.pipeline->start(config_with(milliseconds(1000))));
  EXPECT_EQ(h.pipeline->last_error_code(), error_code::kAlreadyRunning);
  h.pipeline->stop();
}

TEST(ValidateConfig, DefaultsNeedOnlyAFilter) {
  PipelineConfig c;
  EXPECT_EQ(validate_config(c), "filter expression cannot be empty");
  c.filter = "ip";
  EXPECT_EQ(validate_config(c), "");
  EXPECT_EQ(c.interface_name, kAnyInterface);
  EXPECT_EQ(c.smoothing_window, 3u);
  EXPECT_EQ(c.update_interval, milliseconds(1000));
  EXPECT_EQ(c.history_span, std::chrono::seconds(300));
}
