/**
 * tcpgraph — N-API addon.
 * Exposes start(config, onSample), stop(), isRunning(), getLastError() and
 * listInterfaces() to the TypeScript front end.
 * Samples are forwarded from a helper thread through a ThreadSafeFunction;
 * onSample(null) marks the end of the stream.
 */

#include <napi.h>
#include <chrono>
#include <string>
#include <vector>

#include "errors.hpp"
#include "forwarder.hpp"
#include "local_addresses.hpp"
#include "options.hpp"
#include "pipeline.hpp"

namespace {

// Pending JS callbacks per run; beyond this samples are dropped and counted.
constexpr size_t kForwardQueueSize = 16;

tcpgraph::Pipeline* g_pipeline = nullptr;
tcpgraph::SampleForwarder g_forwarder;
std::string g_error_code;
std::string g_error_message;

// Helpers to read config from N-API object
bool get_string(Napi::Env env, const Napi::Object& obj, const char* key, std::string* out) {
  if (!obj.Has(key)) return false;
  Napi::Value v = obj.Get(key);
  if (!v.IsString()) return false;
  *out = v.As<Napi::String>().Utf8Value();
  return true;
}

bool get_number(Napi::Env env, const Napi::Object& obj, const char* key, double* out) {
  if (!obj.Has(key)) return false;
  Napi::Value v = obj.Get(key);
  if (!v.IsNumber()) return false;
  *out = v.As<Napi::Number>().DoubleValue();
  return true;
}

bool get_bool(Napi::Env env, const Napi::Object& obj, const char* key, bool* out) {
  if (!obj.Has(key)) return false;
  Napi::Value v = obj.Get(key);
  if (!v.IsBoolean()) return false;
  *out = v.As<Napi::Boolean>().Value();
  return true;
}

void throw_with_code(Napi::Env env, const std::string& code, const std::string& message) {
  Napi::Error err = Napi::Error::New(env, message);
  err.Set("code", Napi::String::New(env, code));
  err.ThrowAsJavaScriptException();
}

/** Null payload = end of stream. */
void sample_tsf_callback(Napi::Env env, Napi::Function js_callback, tcpgraph::BandwidthSample* sample) {
  if (js_callback.IsEmpty()) {
    delete sample;
    return;
  }
  if (sample == nullptr) {
    js_callback.Call({env.Null()});
    return;
  }
  Napi::Object o = Napi::Object::New(env);
  o.Set("inboundBps", sample->inbound_bps);
  o.Set("outboundBps", sample->outbound_bps);
  o.Set("rawInboundBps", sample->raw_inbound_bps);
  o.Set("rawOutboundBps", sample->raw_outbound_bps);
  o.Set("unknownBps", sample->unknown_bps);
  o.Set("peakInboundBps", sample->peak_inbound_bps);
  o.Set("peakOutboundBps", sample->peak_outbound_bps);
  double ms = std::chrono::duration<double, std::milli>(sample->timestamp.time_since_epoch()).count();
  o.Set("timestamp", Napi::Date::New(env, ms));
  if (sample->final_sample) o.Set("final", true);
  js_callback.Call({o});
  delete sample;
}

tcpgraph::DeliveryResult deliver_sample(const Napi::ThreadSafeFunction& tsf,
                                        const tcpgraph::BandwidthSample* sample) {
  tcpgraph::BandwidthSample* payload = sample != nullptr ? new tcpgraph::BandwidthSample(*sample) : nullptr;
  napi_status status = tsf.NonBlockingCall(payload, sample_tsf_callback);
  if (status == napi_ok) return tcpgraph::DeliveryResult::kDelivered;
  delete payload;
  return status == napi_queue_full ? tcpgraph::DeliveryResult::kFull : tcpgraph::DeliveryResult::kClosed;
}

/** Cancel the pipeline and join both its threads and the forwarder. Safe when nothing is running. */
void teardown() {
  g_forwarder.stop();
  if (g_pipeline != nullptr) g_pipeline->stop();
}

/** Reads an optional numeric option through convert; throws INVALID_CONFIG when it is out of range. */
template <typename T, typename Convert>
bool read_numeric(Napi::Env env, const Napi::Object& obj, const char* key, Convert convert, T* out) {
  double d = 0;
  if (!get_number(env, obj, key, &d)) return true;
  if (convert(d, *out)) return true;
  throw_with_code(env, tcpgraph::error_code::kInvalidConfig,
                  std::string(key) + " must be a finite, non-negative number in range");
  return false;
}

}  // namespace

namespace addon {

Napi::Value Start(const Napi::CallbackInfo& info) {
  Napi::Env env = info.Env();
  if (info.Length() < 2 || !info[0].IsObject() || !info[1].IsFunction()) {
    Napi::TypeError::New(env, "start(config, onSample) requires a config object and a callback")
        .ThrowAsJavaScriptException();
    return env.Null();
  }
  if (g_pipeline != nullptr && g_pipeline->is_running()) {
    throw_with_code(env, tcpgraph::error_code::kAlreadyRunning, "capture already running");
    return env.Null();
  }
  teardown();

  Napi::Object config = info[0].As<Napi::Object>();
  tcpgraph::PipelineConfig cfg;
  get_string(env, config, "interface", &cfg.interface_name);
  get_string(env, config, "filter", &cfg.filter);
  get_bool(env, config, "payloadOnly", &cfg.payload_only);
  if (!read_numeric(env, config, "intervalMs", tcpgraph::number_to_milliseconds, &cfg.update_interval) ||
      !read_numeric(env, config, "smoothing", tcpgraph::number_to_count, &cfg.smoothing_window) ||
      !read_numeric(env, config, "durationMs", tcpgraph::number_to_milliseconds, &cfg.duration_limit) ||
      !read_numeric(env, config, "historySeconds", tcpgraph::number_to_seconds, &cfg.history_span) ||
      !read_numeric(env, config, "frameQueueCapacity", tcpgraph::number_to_count, &cfg.frame_queue_capacity)) {
    return env.Null();
  }
  std::string policy;
  if (get_string(env, config, "unknownPolicy", &policy)) {
    if (policy == "split") {
      cfg.unknown_policy = tcpgraph::UnknownPolicy::kSplit;
    } else if (policy != "exclude") {
      throw_with_code(env, tcpgraph::error_code::kInvalidConfig, "unknownPolicy must be \"exclude\" or \"split\"");
      return env.Null();
    }
  }

  if (g_pipeline == nullptr) g_pipeline = new tcpgraph::Pipeline();
  if (!g_pipeline->start(cfg)) {
    g_error_code = g_pipeline->last_error_code();
    g_error_message = g_pipeline->last_error_message();
    throw_with_code(env, g_error_code, g_error_message);
    return env.Null();
  }
  g_error_code.clear();
  g_error_message.clear();

  // Bounded TSF queue with NonBlockingCall: the forwarder never waits on the JS thread,
  // so stop() can join it from that thread.
  Napi::ThreadSafeFunction tsf =
      Napi::ThreadSafeFunction::New(env, info[1].As<Napi::Function>(), "onSample", kForwardQueueSize, 1);
  if (!g_forwarder.start(
          *g_pipeline,
          [tsf](const tcpgraph::BandwidthSample* sample) { return deliver_sample(tsf, sample); },
          [tsf]() mutable { tsf.Release(); })) {
    tsf.Release();
    g_pipeline->stop();
    throw_with_code(env, tcpgraph::error_code::kAlreadyRunning, "sample forwarder still running");
    return env.Null();
  }
  return Napi::Boolean::New(env, true);
}

Napi::Value Stop(const Napi::CallbackInfo& info) {
  Napi::Env env = info.Env();
  Napi::Object result = Napi::Object::New(env);
  if (g_pipeline == nullptr) return result;
  teardown();
  tcpgraph::PipelineStats s = g_pipeline->stats();
  result.Set("framesProcessed", Napi::Number::New(env, static_cast<double>(s.frames_processed)));
  result.Set("inboundBytes", Napi::Number::New(env, static_cast<double>(s.inbound_bytes)));
  result.Set("outboundBytes", Napi::Number::New(env, static_cast<double>(s.outbound_bytes)));
  result.Set("unknownBytes", Napi::Number::New(env, static_cast<double>(s.unknown_bytes)));
  result.Set("samplesEmitted", Napi::Number::New(env, static_cast<double>(s.samples_emitted)));
  result.Set("samplesDropped",
             Napi::Number::New(env, static_cast<double>(s.samples_dropped + g_forwarder.dropped())));
  result.Set("peakInboundBps", Napi::Number::New(env, s.peak_inbound_bps));
  result.Set("peakOutboundBps", Napi::Number::New(env, s.peak_outbound_bps));
  if (s.capture.valid) {
    result.Set("packetsReceived", Napi::Number::New(env, static_cast<double>(s.capture.received)));
    result.Set("packetsDropped", Napi::Number::New(env, static_cast<double>(s.capture.dropped)));
    result.Set("packetsIfDropped", Napi::Number::New(env, static_cast<double>(s.capture.if_dropped)));
  }
  // Capture failures after start are reported here rather than thrown.
  std::string code = g_pipeline->last_error_code();
  if (!code.empty()) {
    g_error_code = code;
    g_error_message = g_pipeline->last_error_message();
  }
  return result;
}

Napi::Value IsRunning(const Napi::CallbackInfo& info) {
  Napi::Env env = info.Env();
  return Napi::Boolean::New(env, g_pipeline != nullptr && g_pipeline->is_running());
}

Napi::Value GetLastError(const Napi::CallbackInfo& info) {
  Napi::Env env = info.Env();
  Napi::Object o = Napi::Object::New(env);
  o.Set("code", g_error_code);
  o.Set("message", g_error_message);
  return o;
}

Napi::Value ListInterfaces(const Napi::CallbackInfo& info) {
  Napi::Env env = info.Env();
  std::vector<tcpgraph::InterfaceInfo> ifaces = tcpgraph::list_interfaces();
  Napi::Array arr = Napi::Array::New(env, ifaces.size());
  for (size_t i = 0; i < ifaces.size(); i++) {
    Napi::Object o = Napi::Object::New(env);
    o.Set("name", ifaces[i].name);
    if (ifaces[i].has_mac) {
      o.Set("mac", ifaces[i].mac.to_string());
    } else {
      o.Set("mac", env.Null());
    }
    o.Set("up", ifaces[i].is_up);
    o.Set("loopback", ifaces[i].is_loopback);
    arr.Set(static_cast<uint32_t>(i), o);
  }
  return arr;
}

}  // namespace addon

Napi::Object Init(Napi::Env env, Napi::Object exports) {
  // process.exit() skips stop(): join everything before the environment goes away.
  env.AddCleanupHook([]() {
    teardown();
    delete g_pipeline;
    g_pipeline = nullptr;
  });
  exports.Set("start", Napi::Function::New(env, addon::Start));
  exports.Set("stop", Napi::Function::New(env, addon::Stop));
  exports.Set("isRunning", Napi::Function::New(env, addon::IsRunning));
  exports.Set("getLastError", Napi::Function::New(env, addon::GetLastError));
  exports.Set("listInterfaces", Napi::Function::New(env, addon::ListInterfaces));
  return exports;
}

NODE_API_MODULE(tcpgraph_native, Init)
