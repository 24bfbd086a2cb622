#include "internal/network/address.hpp"

#include <algorithm>
#include <stdexcept>

namespace dockyard::network {

uint32_t ParseIpv4(std::string_view text) {
  uint32_t    address = 0;
  int         octets  = 0;
  std::size_t pos     = 0;

  for (;;) {
    const auto end  = std::min(text.find('.', pos), text.size());
    const auto part = text.substr(pos, end - pos);
    if (part.empty() || part.size() > 3 || part.find_first_not_of("0123456789") != std::string_view::npos || ++octets > 4) {
      throw std::invalid_argument("invalid IPv4 address: " + std::string(text));
    }
    const auto value = std::stoul(std::string(part));
    if (value > 255) throw std::invalid_argument("invalid IPv4 address: " + std::string(text));
    address = (address << 8) | static_cast<uint32_t>(value);

    if (end == text.size()) break;
    pos = end + 1;
  }

  if (octets != 4) throw std::invalid_argument("invalid IPv4 address: " + std::string(text));
  return address;
}

std::string FormatIpv4(uint32_t address) {
  return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) + "." + std::to_string((address >> 8) & 0xFF) + "." +
         std::to_string(address & 0xFF);
}

Ipv4Subnet Ipv4Subnet::Parse(std::string_view cidr) {
  const auto slash = cidr.find('/');
  if (slash == std::string_view::npos) throw std::invalid_argument("subnet must be in CIDR form: " + std::string(cidr));

  const auto prefix_text = cidr.substr(slash + 1);
  if (prefix_text.empty() || prefix_text.size() > 2 || prefix_text.find_first_not_of("0123456789") != std::string_view::npos) {
    throw std::invalid_argument("invalid prefix length: " + std::string(cidr));
  }
  const auto prefix = std::stoul(std::string(prefix_text));
  // at least a gateway and one assignable host
  if (prefix > 29) throw std::invalid_argument("subnet too small: " + std::string(cidr));

  return Ipv4Subnet(ParseIpv4(cidr.substr(0, slash)), static_cast<uint8_t>(prefix));
}

Ipv4Subnet::Ipv4Subnet(uint32_t network, uint8_t prefix_length) : network_(0), prefix_length_(prefix_length) {
  if (prefix_length > 32) throw std::invalid_argument("invalid prefix length");
  network_ = network & Mask();
}

uint32_t Ipv4Subnet::Mask() const {
  return prefix_length_ == 0 ? 0 : ~uint32_t{0} << (32 - prefix_length_);
}

uint32_t Ipv4Subnet::Gateway() const {
  return network_ + 1;
}

uint32_t Ipv4Subnet::FirstAssignable() const {
  return network_ + 2;
}

uint32_t Ipv4Subnet::LastAssignable() const {
  return (network_ | ~Mask()) - 1;
}

bool Ipv4Subnet::Contains(uint32_t address) const {
  return (address & Mask()) == network_;
}

bool Ipv4Subnet::Overlaps(const Ipv4Subnet& other) const {
  const auto shorter = prefix_length_ < other.prefix_length_ ? *this : other;
  const auto longer  = prefix_length_ < other.prefix_length_ ? other : *this;
  return shorter.Contains(longer.network_);
}

std::string Ipv4Subnet::ToString() const {
  return FormatIpv4(network_) + "/" + std::to_string(prefix_length_);
}

} // namespace dockyard::network
