/**
 * tcpgraph — Capture implementation.
 * Linux + libpcap only.
 */

#include "capture.hpp"
#include "errors.hpp"
#include <pcap.h>
#include <chrono>
#include <cstdio>
#include <cstring>

namespace tcpgraph {

namespace {

LinkType link_type_from_dlt(int dlt) {
  switch (dlt) {
    case DLT_EN10MB: return LinkType::kEthernet;
    case DLT_LINUX_SLL: return LinkType::kLinuxCooked;
    default: break;
  }
  return LinkType::kUnsupported;
}

/** Map a pcap_activate() failure onto our setup error codes. */
const char* activate_error_code(int rc) {
  switch (rc) {
    case PCAP_ERROR_NO_SUCH_DEVICE: return error_code::kInterfaceNotFound;
    case PCAP_ERROR_PERM_DENIED:
    case PCAP_ERROR_PROMISC_PERM_DENIED: return error_code::kPermissionDenied;
    default: break;
  }
  return error_code::kCaptureOpenFailed;
}

std::chrono::system_clock::time_point to_time_point(const struct timeval& tv) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::seconds(tv.tv_sec) + std::chrono::microseconds(tv.tv_usec)));
}

}  // namespace

CaptureEngine::CaptureEngine() = default;

CaptureEngine::~CaptureEngine() {
  stop();
}

void CaptureEngine::report_error(const std::string& code, const std::string& message) {
  last_error_code_ = code;
  last_error_message_ = message;
  if (on_error_) on_error_(code, message);
}

bool CaptureEngine::fail_setup(const std::string& code, const std::string& message) {
  last_error_code_ = code;
  last_error_message_ = message;
  close_handle();
  return false;
}

void CaptureEngine::close_handle() {
  if (bpf_program_ != nullptr) {
    pcap_freecode(bpf_program_);
    delete bpf_program_;
    bpf_program_ = nullptr;
  }
  if (pcap_handle_ != nullptr) {
    pcap_close(pcap_handle_);
    pcap_handle_ = nullptr;
  }
}

bool CaptureEngine::start(const CaptureConfig& config, FrameQueue& queue, ErrorCallback on_error) {
  if (running_) {
    last_error_code_ = error_code::kAlreadyRunning;
    last_error_message_ = "capture already running";
    return false;
  }
  config_ = config;
  queue_ = &queue;
  on_error_ = std::move(on_error);
  last_error_code_.clear();
  last_error_message_.clear();
  last_stats_ = CaptureStats{};

  char errbuf[PCAP_ERRBUF_SIZE];
  errbuf[0] = '\0';
  const std::string& iface = config_.interface_name;
  pcap_handle_ = pcap_create(iface.c_str(), errbuf);
  if (pcap_handle_ == nullptr) {
    return fail_setup(error_code::kCaptureOpenFailed, std::string("pcap_create: ") + errbuf);
  }
  pcap_set_snaplen(pcap_handle_, config_.snaplen);
  pcap_set_promisc(pcap_handle_, config_.promiscuous ? 1 : 0);
  pcap_set_timeout(pcap_handle_, config_.read_timeout_ms);

  int rc = pcap_activate(pcap_handle_);
  if (rc < 0) {
    std::string detail = pcap_statustostr(rc);
    if (rc == PCAP_ERROR || rc == PCAP_ERROR_PERM_DENIED || rc == PCAP_ERROR_NO_SUCH_DEVICE) {
      const char* msg = pcap_geterr(pcap_handle_);
      if (msg != nullptr && msg[0] != '\0') detail += std::string(": ") + msg;
    }
    return fail_setup(activate_error_code(rc), "pcap_activate(" + iface + "): " + detail);
  }
  if (rc > 0) {
    fprintf(stderr, "[tcpgraph] capture_warning interface=%s warning=%s\n",
            iface.c_str(), pcap_statustostr(rc));
  }

  int dlt = pcap_datalink(pcap_handle_);
  link_type_ = link_type_from_dlt(dlt);
  if (link_type_ == LinkType::kUnsupported && pcap_set_datalink(pcap_handle_, DLT_EN10MB) == 0) {
    dlt = DLT_EN10MB;
    link_type_ = LinkType::kEthernet;
  }
  if (link_type_ == LinkType::kUnsupported) {
    // Frames still count toward totals; direction will be unknown.
    fprintf(stderr, "[tcpgraph] unsupported_datalink interface=%s dlt=%d\n", iface.c_str(), dlt);
  }

  bpf_program_ = new bpf_program{};
  if (pcap_compile(pcap_handle_, bpf_program_, config_.filter.c_str(), 1, PCAP_NETMASK_UNKNOWN) != 0) {
    std::string msg = std::string("pcap_compile: ") + pcap_geterr(pcap_handle_);
    // The program was never filled in; nothing for pcap_freecode to release.
    delete bpf_program_;
    bpf_program_ = nullptr;
    return fail_setup(error_code::kFilterInvalid, msg);
  }
  if (pcap_setfilter(pcap_handle_, bpf_program_) != 0) {
    return fail_setup(error_code::kFilterInvalid, std::string("pcap_setfilter: ") + pcap_geterr(pcap_handle_));
  }

  // Startup log (structured: interface, filter, datalink)
  fprintf(stderr,
          "{\"timestamp\":\"startup\",\"level\":\"info\",\"message\":\"capture started\","
          "\"interface\":\"%s\",\"filter\":\"%s\",\"datalink\":\"%s\",\"snaplen\":%d,"
          "\"payload_only\":%s}\n",
          iface.c_str(), config_.filter.c_str(), link_type_name(link_type_), config_.snaplen,
          config_.payload_only ? "true" : "false");

  running_ = true;
  stop_requested_ = false;
  capture_thread_ = std::thread(&CaptureEngine::run_loop, this);
  return true;
}

void CaptureEngine::stop() {
  if (!running_ && pcap_handle_ == nullptr && !capture_thread_.joinable()) return;
  stop_requested_ = true;
  if (pcap_handle_ != nullptr) {
    pcap_breakloop(pcap_handle_);
  }
  if (capture_thread_.joinable()) {
    capture_thread_.join();
  }
  running_ = false;
  if (pcap_handle_ != nullptr) {
    struct pcap_stat ps;
    if (pcap_stats(pcap_handle_, &ps) == 0) {
      last_stats_.received = ps.ps_recv;
      last_stats_.dropped = ps.ps_drop;
      last_stats_.if_dropped = ps.ps_ifdrop;
      last_stats_.valid = true;
    }
    fprintf(stderr,
            "{\"timestamp\":\"shutdown\",\"level\":\"info\",\"message\":\"capture stopped\","
            "\"interface\":\"%s\",\"received\":%u,\"dropped\":%u,\"ifdropped\":%u}\n",
            config_.interface_name.c_str(), last_stats_.received, last_stats_.dropped,
            last_stats_.if_dropped);
  }
  close_handle();
}

void CaptureEngine::run_loop() {
  if (pcap_handle_ == nullptr || queue_ == nullptr) return;
  while (!stop_requested_) {
    struct pcap_pkthdr* header = nullptr;
    const u_char* bytes = nullptr;
    int r = pcap_next_ex(pcap_handle_, &header, &bytes);
    if (r == 0) continue;  // read timeout, re-check stop flag
    if (r == PCAP_ERROR_BREAK) break;
    if (r < 0) {
      report_error(error_code::kCaptureFailed, std::string("pcap_next_ex: ") + pcap_geterr(pcap_handle_));
      break;
    }
    CapturedFrame frame;
    frame.caplen = header->caplen;
    frame.wire_len = header->len;
    frame.timestamp = to_time_point(header->ts);
    frame.data.assign(bytes, bytes + header->caplen);
    // Blocks while the aggregation side is behind; fails once the queue is closed.
    if (!queue_->push(std::move(frame))) break;
  }
  running_ = false;
}

}  // namespace tcpgraph
