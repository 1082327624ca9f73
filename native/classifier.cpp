/**
 * tcpgraph — Direction classifier implementation.
 */

#include "classifier.hpp"

namespace tcpgraph {

const char* direction_name(Direction d) {
  switch (d) {
    case Direction::kInbound: return "inbound";
    case Direction::kOutbound: return "outbound";
    case Direction::kUnknown: break;
  }
  return "unknown";
}

Direction classify(const EndpointFacts& facts) {
  if (facts.dst_is_group) {
    return facts.src_is_local ? Direction::kOutbound : Direction::kInbound;
  }
  if (facts.src_is_local && !facts.dst_is_local) return Direction::kOutbound;
  if (!facts.src_is_local && facts.dst_is_local) return Direction::kInbound;
  return Direction::kUnknown;
}

Direction classify_direction(const uint8_t* data, size_t len, LinkType link_type,
                             const LocalAddressSet& local) {
  LinkHeader header = parse_link_header(data, len, link_type);
  EndpointFacts facts;

  if (const auto* eth = std::get_if<EthernetHeader>(&header)) {
    facts.src_is_local = local.contains(eth->source);
    facts.dst_is_local = local.contains(eth->destination);
    facts.dst_is_group = eth->destination.is_broadcast() || eth->destination.is_multicast();
    return classify(facts);
  }

  if (const auto* sll = std::get_if<LinuxCookedHeader>(&header)) {
    // Cooked headers drop the destination; the kernel's packet type says where it went.
    facts.src_is_local = sll->packet_type == LinuxCookedHeader::kOutgoing ||
                         (sll->has_source && local.contains(sll->source));
    facts.dst_is_local = sll->packet_type == LinuxCookedHeader::kHost;
    facts.dst_is_group = sll->packet_type == LinuxCookedHeader::kBroadcast ||
                         sll->packet_type == LinuxCookedHeader::kMulticast;
    return classify(facts);
  }

  return Direction::kUnknown;
}

}  // namespace tcpgraph
