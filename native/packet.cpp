/**
 * tcpgraph — Frame header parsing implementation.
 * Ethernet II and Linux cooked (SLL) link headers, IPv4 and IPv6 base
 * headers, TCP and UDP. No VLAN tags, no IPv6 extension header walking.
 */

#include "packet.hpp"
#include <cstdio>
#include <net/ethernet.h>
#include <netinet/in.h>

namespace tcpgraph {

namespace {

uint16_t read_u16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

MacAddress read_mac(const uint8_t* p) {
  MacAddress mac;
  for (size_t i = 0; i < mac.octets.size(); i++) mac.octets[i] = p[i];
  return mac;
}

const size_t kIpv4MinHeaderLen = 20;
const size_t kTcpMinHeaderLen = 20;

}  // namespace

bool MacAddress::is_broadcast() const {
  for (uint8_t b : octets) {
    if (b != 0xff) return false;
  }
  return true;
}

bool MacAddress::is_multicast() const {
  return (octets[0] & 0x01) != 0;
}

bool MacAddress::is_zero() const {
  for (uint8_t b : octets) {
    if (b != 0) return false;
  }
  return true;
}

std::string MacAddress::to_string() const {
  char buf[18];
  snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
           octets[0], octets[1], octets[2], octets[3], octets[4], octets[5]);
  return std::string(buf);
}

const char* link_type_name(LinkType type) {
  switch (type) {
    case LinkType::kEthernet: return "EN10MB";
    case LinkType::kLinuxCooked: return "LINUX_SLL";
    case LinkType::kUnsupported: break;
  }
  return "unsupported";
}

LinkHeader parse_link_header(const uint8_t* data, size_t len, LinkType type) {
  switch (type) {
    case LinkType::kEthernet: {
      // 6 dst MAC, 6 src MAC, 2 type
      if (data == nullptr || len < kEthernetHeaderLen) return Malformed{};
      EthernetHeader eth;
      eth.destination = read_mac(data);
      eth.source = read_mac(data + 6);
      eth.ether_type = read_u16(data + 12);
      return eth;
    }
    case LinkType::kLinuxCooked: {
      // 2 packet type, 2 ARPHRD type, 2 address length, 8 address, 2 protocol
      if (data == nullptr || len < kLinuxCookedHeaderLen) return Malformed{};
      LinuxCookedHeader sll;
      sll.packet_type = read_u16(data);
      uint16_t halen = read_u16(data + 4);
      if (halen == 6) {
        sll.source = read_mac(data + 6);
        sll.has_source = true;
      }
      sll.protocol = read_u16(data + 14);
      return sll;
    }
    case LinkType::kUnsupported:
      break;
  }
  return Unrecognized{};
}

size_t link_header_length(const LinkHeader& header) {
  if (std::holds_alternative<EthernetHeader>(header)) return kEthernetHeaderLen;
  if (std::holds_alternative<LinuxCookedHeader>(header)) return kLinuxCookedHeaderLen;
  return 0;
}

uint16_t link_payload_type(const LinkHeader& header) {
  if (const auto* eth = std::get_if<EthernetHeader>(&header)) return eth->ether_type;
  if (const auto* sll = std::get_if<LinuxCookedHeader>(&header)) return sll->protocol;
  return 0;
}

NetworkHeader parse_network_header(uint16_t ether_type, const uint8_t* data, size_t len) {
  if (ether_type == ETHERTYPE_IP) {
    if (data == nullptr || len < kIpv4MinHeaderLen) return Malformed{};
    if ((data[0] >> 4) != 4) return Malformed{};
    Ipv4Header ip;
    ip.header_len = static_cast<size_t>(data[0] & 0x0f) * 4;
    ip.total_len = read_u16(data + 2);
    ip.protocol = data[9];
    if (ip.header_len < kIpv4MinHeaderLen) return Malformed{};
    if (ip.header_len > ip.total_len) return Malformed{};
    if (ip.header_len > len) return Malformed{};
    return ip;
  }
  if (ether_type == ETHERTYPE_IPV6) {
    if (data == nullptr || len < kIpv6HeaderLen) return Malformed{};
    if ((data[0] >> 4) != 6) return Malformed{};
    Ipv6Header ip6;
    ip6.payload_len = read_u16(data + 4);
    ip6.next_header = data[6];
    return ip6;
  }
  return Unrecognized{};
}

TransportHeader parse_transport_header(uint8_t protocol, const uint8_t* data, size_t len) {
  if (protocol == IPPROTO_TCP) {
    // Data offset lives in the high nibble of byte 12.
    if (data == nullptr || len < 13) return Malformed{};
    TcpHeader tcp;
    tcp.header_len = static_cast<size_t>(data[12] >> 4) * 4;
    if (tcp.header_len < kTcpMinHeaderLen) return Malformed{};
    return tcp;
  }
  if (protocol == IPPROTO_UDP) {
    if (data == nullptr || len < kUdpHeaderLen) return Malformed{};
    UdpHeader udp;
    udp.length = read_u16(data + 4);
    if (udp.length < kUdpHeaderLen) return Malformed{};
    return udp;
  }
  return Unrecognized{};
}

}  // namespace tcpgraph
