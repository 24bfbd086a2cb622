#include "internal/network/virtual_network.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dockyard::network {

using dockyard::observability::BoolField;
using dockyard::observability::StringField;

NetworkRegistry::NetworkRegistry(const std::string& default_subnet, const std::vector<std::string>& project_subnets) {
  if (project_subnets.empty()) {
    for (int octet = 18; octet <= 31; ++octet) pool_.push_back(Ipv4Subnet::Parse("172." + std::to_string(octet) + ".0.0/16"));
  } else {
    for (const auto& subnet : project_subnets) pool_.push_back(Ipv4Subnet::Parse(subnet));
  }

  CreateNetwork(kDefaultNetwork, NetworkOptions{false, default_subnet});
}

NetworkRegistry::Network& NetworkRegistry::GetLocked(const std::string& id) {
  auto it = networks_.find(id);
  if (it == networks_.end()) throw util::NotFound("network not found: " + id);
  return it->second;
}

const NetworkRegistry::Network& NetworkRegistry::GetLocked(const std::string& id) const {
  auto it = networks_.find(id);
  if (it == networks_.end()) throw util::NotFound("network not found: " + id);
  return it->second;
}

Ipv4Subnet NetworkRegistry::AllocateSubnetLocked(const std::string& id) const {
  for (const auto& candidate : pool_) {
    bool taken = false;
    for (const auto& [name, network] : networks_) {
      if (network.info.subnet.Overlaps(candidate)) {
        taken = true;
        break;
      }
    }
    if (!taken) return candidate;
  }
  throw util::NetworkAddressExhausted("no free subnet left in the pool for network " + id);
}

NetworkInfo NetworkRegistry::CreateNetwork(const std::string& id, const NetworkOptions& options) {
  if (id.empty()) throw std::invalid_argument("network id must not be empty");

  std::unique_lock lock(mutex_);
  if (networks_.count(id)) throw util::AlreadyExists("network already exists: " + id);

  const auto subnet = options.subnet.empty() ? AllocateSubnetLocked(id) : Ipv4Subnet::Parse(options.subnet);
  for (const auto& [name, network] : networks_) {
    if (network.info.subnet.Overlaps(subnet)) {
      throw util::AlreadyExists("subnet " + subnet.ToString() + " overlaps network " + name);
    }
  }

  Network network{NetworkInfo{id, subnet, options.dns_enabled}};
  auto    info = network.info;
  networks_.emplace(id, std::move(network));

  DOCKYARD_LOG_INFO("network created", {StringField("network", id), StringField("subnet", subnet.ToString()), BoolField("dns", options.dns_enabled)});
  return info;
}

NetworkInfo NetworkRegistry::EnsureNetwork(const std::string& id) {
  if (auto existing = FindNetwork(id)) return *existing;
  try {
    return CreateNetwork(id);
  } catch (const util::AlreadyExists&) {
    // lost a creation race; the winner's network is the one to use
    if (auto existing = FindNetwork(id)) return *existing;
    throw;
  }
}

std::optional<NetworkInfo> NetworkRegistry::FindNetwork(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto             it = networks_.find(id);
  if (it == networks_.end()) return std::nullopt;
  return it->second.info;
}

bool NetworkRegistry::RemoveNetwork(const std::string& id) {
  if (id == kDefaultNetwork) throw util::InvalidState("the default network cannot be removed");

  std::unique_lock lock(mutex_);
  auto             it = networks_.find(id);
  if (it == networks_.end()) return false;
  if (!it->second.members.empty()) {
    throw util::InvalidState("network " + id + " still has " + std::to_string(it->second.members.size()) + " member(s)");
  }
  networks_.erase(it);

  DOCKYARD_LOG_INFO("network removed", {StringField("network", id)});
  return true;
}

std::string NetworkRegistry::Join(const std::string& network_id, const std::string& instance_id, const std::string& service_name) {
  std::unique_lock lock(mutex_);
  auto&            network = GetLocked(network_id);
  if (network.members.count(instance_id)) {
    throw util::AlreadyExists("instance " + instance_id + " already joined network " + network_id);
  }

  const auto& subnet  = network.info.subnet;
  uint32_t    address = subnet.FirstAssignable();
  for (auto used : network.used) {
    if (used < address) continue;
    if (used != address) break;
    ++address;
  }
  if (address > subnet.LastAssignable()) {
    throw util::NetworkAddressExhausted("no free address in network " + network_id + " (" + subnet.ToString() + ")");
  }

  Member member;
  member.membership = Membership{instance_id, service_name, FormatIpv4(address)};
  member.address    = address;
  member.sequence   = network.next_sequence++;

  network.used.insert(address);
  network.names[service_name] = instance_id;
  network.members.emplace(instance_id, member);

  DOCKYARD_LOG_INFO("network join", {StringField("network", network_id), StringField("instance", instance_id), StringField("service", service_name),
                                     StringField("address", member.membership.address)});
  return member.membership.address;
}

bool NetworkRegistry::Leave(const std::string& network_id, const std::string& instance_id) {
  std::unique_lock lock(mutex_);
  auto             network_it = networks_.find(network_id);
  if (network_it == networks_.end()) return false;

  auto& network = network_it->second;
  auto  it      = network.members.find(instance_id);
  if (it == network.members.end()) return false;

  const auto member = it->second;
  network.members.erase(it);
  network.used.erase(member.address);

  const auto& service = member.membership.service_name;
  auto        binding = network.names.find(service);
  if (binding != network.names.end() && binding->second == instance_id) {
    const Member* newest = nullptr;
    for (const auto& [id, candidate] : network.members) {
      if (candidate.membership.service_name == service && (!newest || candidate.sequence > newest->sequence)) newest = &candidate;
    }
    if (newest) {
      binding->second = newest->membership.instance_id;
    } else {
      network.names.erase(binding);
    }
  }

  DOCKYARD_LOG_INFO("network leave", {StringField("network", network_id), StringField("instance", instance_id), StringField("service", service),
                                      StringField("address", member.membership.address)});
  return true;
}

std::string NetworkRegistry::Resolve(const std::string& network_id, const std::string& service_name) const {
  std::shared_lock lock(mutex_);
  const auto&      network = GetLocked(network_id);
  if (!network.info.dns_enabled) {
    throw util::ResolveNotFound("network " + network_id + " does not resolve service names (looked up " + service_name + ")");
  }

  auto binding = network.names.find(service_name);
  if (binding == network.names.end()) {
    throw util::ResolveNotFound("service " + service_name + " is not joined to network " + network_id);
  }
  return network.members.at(binding->second).membership.address;
}

std::vector<Membership> NetworkRegistry::Members(const std::string& network_id) const {
  std::shared_lock        lock(mutex_);
  std::vector<Membership> out;
  for (const auto& [id, member] : GetLocked(network_id).members) out.push_back(member.membership);
  return out;
}

} // namespace dockyard::network
