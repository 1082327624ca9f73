/**
 * tcpgraph — Frame header parsing.
 * Decodes the fixed-layout link, network and transport headers of a captured
 * frame into tagged unions. Every layer carries an explicit Unrecognized
 * alternative (type we do not parse) and a Malformed alternative (type known,
 * fields out of range or not fully captured).
 */

#ifndef TCPGRAPH_PACKET_HPP
#define TCPGRAPH_PACKET_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace tcpgraph {

/** 6-byte link-layer (MAC) address. */
struct MacAddress {
  std::array<uint8_t, 6> octets{};

  bool is_broadcast() const;
  /** Group bit set (includes broadcast). */
  bool is_multicast() const;
  bool is_zero() const;
  std::string to_string() const;

  bool operator==(const MacAddress& other) const { return octets == other.octets; }
  bool operator!=(const MacAddress& other) const { return octets != other.octets; }
};

/** Datalink types we know how to walk. Mapped from pcap_datalink() by the capture layer. */
enum class LinkType {
  kEthernet,     // DLT_EN10MB
  kLinuxCooked,  // DLT_LINUX_SLL, what the "any" pseudo-device produces
  kUnsupported,
};

const char* link_type_name(LinkType type);

/** One raw frame handed from the capture thread to the aggregation thread. */
struct CapturedFrame {
  std::vector<uint8_t> data;  // caplen bytes
  uint32_t caplen{0};
  uint32_t wire_len{0};
  std::chrono::system_clock::time_point timestamp{};
};

struct Unrecognized {};
struct Malformed {};

struct EthernetHeader {
  MacAddress destination;
  MacAddress source;
  uint16_t ether_type{0};
};

/** Linux cooked capture v1. Only the sender's address is recorded. */
struct LinuxCookedHeader {
  enum PacketType : uint16_t {
    kHost = 0,
    kBroadcast = 1,
    kMulticast = 2,
    kOtherHost = 3,
    kOutgoing = 4,
  };
  uint16_t packet_type{0};
  MacAddress source;
  bool has_source{false};  // halen == 6
  uint16_t protocol{0};
};

using LinkHeader = std::variant<Unrecognized, Malformed, EthernetHeader, LinuxCookedHeader>;

struct Ipv4Header {
  size_t header_len{0};  // IHL * 4
  uint16_t total_len{0};
  uint8_t protocol{0};
};

struct Ipv6Header {
  uint16_t payload_len{0};  // excludes the 40-byte base header
  uint8_t next_header{0};
};

using NetworkHeader = std::variant<Unrecognized, Malformed, Ipv4Header, Ipv6Header>;

struct TcpHeader {
  size_t header_len{0};  // data offset * 4
};

struct UdpHeader {
  uint16_t length{0};  // header + payload
};

using TransportHeader = std::variant<Unrecognized, Malformed, TcpHeader, UdpHeader>;

constexpr size_t kEthernetHeaderLen = 14;
constexpr size_t kLinuxCookedHeaderLen = 16;
constexpr size_t kIpv6HeaderLen = 40;
constexpr size_t kUdpHeaderLen = 8;

/** Parse the link header of a frame captured with the given datalink type. */
LinkHeader parse_link_header(const uint8_t* data, size_t len, LinkType type);

/** Bytes occupied by a successfully parsed link header; 0 otherwise. */
size_t link_header_length(const LinkHeader& header);

/** EtherType of the encapsulated packet; 0 when the link header did not parse. */
uint16_t link_payload_type(const LinkHeader& header);

/**
 * Parse the network header that starts at data (after the link header).
 * len is the number of captured bytes from that point.
 */
NetworkHeader parse_network_header(uint16_t ether_type, const uint8_t* data, size_t len);

/** Parse the transport header identified by an IP protocol / next-header value. */
TransportHeader parse_transport_header(uint8_t protocol, const uint8_t* data, size_t len);

}  // namespace tcpgraph

namespace std {
template <>
struct hash<tcpgraph::MacAddress> {
  size_t operator()(const tcpgraph::MacAddress& mac) const {
    uint64_t v = 0;
    for (uint8_t b : mac.octets) v = (v << 8) | b;
    return std::hash<uint64_t>{}(v);
  }
};
}  // namespace std

#endif  // TCPGRAPH_PACKET_HPP
