/**
 * tcpgraph — Payload extractor implementation.
 */

#include "payload.hpp"
#include <netinet/in.h>

namespace tcpgraph {

namespace {

/** Payload bytes behind an IPv4 header, or -1 when a header is out of range. */
int64_t ipv4_payload(const Ipv4Header& ip, const uint8_t* l4, size_t l4_avail) {
  TransportHeader transport = parse_transport_header(ip.protocol, l4, l4_avail);
  if (std::holds_alternative<Malformed>(transport)) return -1;
  if (const auto* tcp = std::get_if<TcpHeader>(&transport)) {
    if (ip.header_len + tcp->header_len > ip.total_len) return -1;
    return static_cast<int64_t>(ip.total_len) - ip.header_len - tcp->header_len;
  }
  if (const auto* udp = std::get_if<UdpHeader>(&transport)) {
    if (ip.header_len + udp->length > ip.total_len) return -1;
    return static_cast<int64_t>(udp->length) - kUdpHeaderLen;
  }
  return static_cast<int64_t>(ip.total_len) - ip.header_len;
}

int64_t ipv6_payload(const Ipv6Header& ip6, const uint8_t* l4, size_t l4_avail) {
  if (ip6.next_header != IPPROTO_TCP) return ip6.payload_len;
  TransportHeader transport = parse_transport_header(ip6.next_header, l4, l4_avail);
  const auto* tcp = std::get_if<TcpHeader>(&transport);
  if (tcp == nullptr || tcp->header_len > ip6.payload_len) return -1;
  return static_cast<int64_t>(ip6.payload_len) - tcp->header_len;
}

}  // namespace

uint32_t frame_byte_count(const uint8_t* data, uint32_t caplen, LinkType link_type,
                          CountMode mode) {
  if (mode == CountMode::kFullFrame) return caplen;

  LinkHeader link = parse_link_header(data, caplen, link_type);
  size_t l2_len = link_header_length(link);
  if (l2_len == 0) return caplen;

  const uint8_t* l3 = data + l2_len;
  size_t l3_avail = caplen - l2_len;
  NetworkHeader network = parse_network_header(link_payload_type(link), l3, l3_avail);

  int64_t payload = -1;
  if (const auto* ip = std::get_if<Ipv4Header>(&network)) {
    payload = ipv4_payload(*ip, l3 + ip->header_len, l3_avail - ip->header_len);
  } else if (const auto* ip6 = std::get_if<Ipv6Header>(&network)) {
    payload = ipv6_payload(*ip6, l3 + kIpv6HeaderLen, l3_avail - kIpv6HeaderLen);
  }
  if (payload < 0) return caplen;
  return static_cast<uint32_t>(payload);
}

}  // namespace tcpgraph
