#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/network/address.hpp"

namespace dockyard::network {

struct NetworkOptions {
  bool dns_enabled = true;

  // CIDR; empty takes the next free subnet from the pool
  std::string subnet;
};

struct NetworkInfo {
  std::string id;
  Ipv4Subnet  subnet;
  bool        dns_enabled = true;
};

struct Membership {
  std::string instance_id;
  std::string service_name;
  std::string address;
};

/*
  Isolated virtual networks with service-name resolution.

  - Each network has its own address space; Join hands out the lowest free
    address after the gateway and fails fast with NetworkAddressExhausted.
  - The pre-existing "bridge" network does no name resolution; networks
    created for a project do.
  - A service name is bound to the most recently joined instance. When
    that instance leaves, the name falls back to the newest remaining
    instance of the service, or becomes unbound.
  - Resolve reads the live table on every call; nothing is cached.

  Resolve runs under a shared lock, Join/Leave under an exclusive one.
*/
class NetworkRegistry {
 public:
  static constexpr const char* kDefaultNetwork = "bridge";

  explicit NetworkRegistry(const std::string& default_subnet = "172.17.0.0/16", const std::vector<std::string>& project_subnets = {});

  NetworkInfo                CreateNetwork(const std::string& id, const NetworkOptions& options = {}); // util::AlreadyExists
  NetworkInfo                EnsureNetwork(const std::string& id);
  std::optional<NetworkInfo> FindNetwork(const std::string& id) const;

  // util::InvalidState while instances are attached or for the default network.
  bool RemoveNetwork(const std::string& id);

  std::string Join(const std::string& network, const std::string& instance_id, const std::string& service_name);
  bool        Leave(const std::string& network, const std::string& instance_id);

  std::string             Resolve(const std::string& network, const std::string& service_name) const;
  std::vector<Membership> Members(const std::string& network) const;

 private:
  struct Member {
    Membership membership;
    uint32_t   address  = 0;
    uint64_t   sequence = 0;
  };

  struct Network {
    NetworkInfo                        info;
    std::map<std::string, Member>      members; // by instance id
    std::set<uint32_t>                 used;
    std::map<std::string, std::string> names; // service name -> instance id
    uint64_t                           next_sequence = 0;
  };

  Network&       GetLocked(const std::string& id);
  const Network& GetLocked(const std::string& id) const;
  Ipv4Subnet     AllocateSubnetLocked(const std::string& id) const;

  mutable std::shared_mutex      mutex_;
  std::map<std::string, Network> networks_;
  std::vector<Ipv4Subnet>        pool_;
};

} // namespace dockyard::network
