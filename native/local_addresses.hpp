/**
 * tcpgraph — Local address set resolver.
 * Which link-layer addresses count as "ours" when classifying direction.
 */

#ifndef TCPGRAPH_LOCAL_ADDRESSES_HPP
#define TCPGRAPH_LOCAL_ADDRESSES_HPP

#include "packet.hpp"
#include <initializer_list>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tcpgraph {

/** Selector meaning "every active interface". Also the pcap pseudo-device name. */
constexpr const char* kAnyInterface = "any";

/** Immutable after construction; safe to share across threads without locking. */
class LocalAddressSet {
 public:
  LocalAddressSet() = default;
  explicit LocalAddressSet(std::unordered_set<MacAddress> addresses)
      : addresses_(std::move(addresses)) {}
  LocalAddressSet(std::initializer_list<MacAddress> addresses) : addresses_(addresses) {}

  bool contains(const MacAddress& mac) const { return addresses_.count(mac) != 0; }
  size_t size() const { return addresses_.size(); }
  bool empty() const { return addresses_.empty(); }
  const std::unordered_set<MacAddress>& addresses() const { return addresses_; }

 private:
  std::unordered_set<MacAddress> addresses_;
};

/** One enumerated interface. */
struct InterfaceInfo {
  std::string name;
  MacAddress mac;
  bool has_mac{false};
  bool is_up{false};
  bool is_loopback{false};
};

/** Enumerate interfaces via getifaddrs (AF_PACKET entries). Empty on failure. */
std::vector<InterfaceInfo> list_interfaces();

/**
 * Build the local set for selector from an already enumerated list.
 * "any" unions the addresses of every up interface; a name takes that one
 * interface's address (empty set if it has none).
 * Returns false only when a specific name is not in the list.
 */
bool build_local_address_set(const std::string& selector,
                             const std::vector<InterfaceInfo>& interfaces,
                             LocalAddressSet& out);

/** build_local_address_set over list_interfaces(). */
bool resolve_local_addresses(const std::string& selector, LocalAddressSet& out);

}  // namespace tcpgraph

#endif  // TCPGRAPH_LOCAL_ADDRESSES_HPP
