/**
 * tcpgraph — Direction classifier.
 * Frame + local address set -> inbound / outbound / unknown.
 */

#ifndef TCPGRAPH_CLASSIFIER_HPP
#define TCPGRAPH_CLASSIFIER_HPP

#include "local_addresses.hpp"
#include "packet.hpp"
#include <cstddef>
#include <cstdint>

namespace tcpgraph {

enum class Direction {
  kInbound,
  kOutbound,
  kUnknown,  // transit, local-to-local, or unparseable
};

const char* direction_name(Direction d);

/**
 * Address facts about one frame, independent of the link type that carried
 * them. Exposed so the precedence rules can be tested on their own.
 */
struct EndpointFacts {
  bool src_is_local{false};
  bool dst_is_local{false};
  bool dst_is_group{false};  // broadcast or multicast destination
};

/**
 * Precedence: group destination is decided by src_is_local alone;
 * otherwise (local, remote) -> outbound, (remote, local) -> inbound,
 * anything else -> unknown.
 */
Direction classify(const EndpointFacts& facts);

/** Parse the link header of a raw frame and classify it. Unknown when it does not parse. */
Direction classify_direction(const uint8_t* data, size_t len, LinkType link_type,
                             const LocalAddressSet& local);

}  // namespace tcpgraph

#endif  // TCPGRAPH_CLASSIFIER_HPP
