/**
 * tcpgraph — Local address set resolver implementation.
 * Linux only: link addresses come from AF_PACKET entries of getifaddrs().
 */

#include "local_addresses.hpp"
#include <algorithm>
#include <cstdio>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <sys/socket.h>

namespace tcpgraph {

std::vector<InterfaceInfo> list_interfaces() {
  std::vector<InterfaceInfo> result;
  struct ifaddrs* head = nullptr;
  if (getifaddrs(&head) != 0) {
    fprintf(stderr, "[tcpgraph] getifaddrs_failed\n");
    return result;
  }
  for (struct ifaddrs* ifa = head; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_name == nullptr) continue;
    // getifaddrs yields one entry per address family; merge them by name.
    auto it = std::find_if(result.begin(), result.end(),
                           [&](const InterfaceInfo& i) { return i.name == ifa->ifa_name; });
    if (it == result.end()) {
      InterfaceInfo info;
      info.name = ifa->ifa_name;
      result.push_back(info);
      it = result.end() - 1;
    }
    it->is_up = it->is_up || (ifa->ifa_flags & IFF_UP) != 0;
    it->is_loopback = it->is_loopback || (ifa->ifa_flags & IFF_LOOPBACK) != 0;

    if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_PACKET) continue;
    const auto* ll = reinterpret_cast<const struct sockaddr_ll*>(ifa->ifa_addr);
    if (ll->sll_halen != 6) continue;
    MacAddress mac;
    for (size_t i = 0; i < mac.octets.size(); i++) mac.octets[i] = ll->sll_addr[i];
    if (mac.is_zero()) continue;  // loopback, tun and friends
    it->mac = mac;
    it->has_mac = true;
  }
  freeifaddrs(head);
  return result;
}

bool build_local_address_set(const std::string& selector,
                             const std::vector<InterfaceInfo>& interfaces,
                             LocalAddressSet& out) {
  std::unordered_set<MacAddress> macs;
  if (selector == kAnyInterface) {
    for (const auto& iface : interfaces) {
      if (iface.is_up && iface.has_mac) macs.insert(iface.mac);
    }
    out = LocalAddressSet(std::move(macs));
    return true;
  }
  for (const auto& iface : interfaces) {
    if (iface.name != selector) continue;
    if (iface.has_mac) macs.insert(iface.mac);
    out = LocalAddressSet(std::move(macs));
    return true;
  }
  return false;
}

bool resolve_local_addresses(const std::string& selector, LocalAddressSet& out) {
  return build_local_address_set(selector, list_interfaces(), out);
}

}  // namespace tcpgraph
