#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace dockyard::network {

// Throw std::invalid_argument on malformed input.
uint32_t    ParseIpv4(std::string_view text);
std::string FormatIpv4(uint32_t address);

/*
  IPv4 range in CIDR form. Usable host addresses exclude the network and
  broadcast addresses; the first host address is the gateway.
*/
class Ipv4Subnet {
 public:
  static Ipv4Subnet Parse(std::string_view cidr);

  Ipv4Subnet(uint32_t network, uint8_t prefix_length);

  uint32_t network() const {
    return network_;
  }
  uint8_t prefix_length() const {
    return prefix_length_;
  }

  uint32_t Gateway() const;
  uint32_t FirstAssignable() const; // after the gateway
  uint32_t LastAssignable() const;  // before broadcast

  bool Contains(uint32_t address) const;
  bool Overlaps(const Ipv4Subnet& other) const;

  std::string ToString() const;

 private:
  uint32_t Mask() const;

  uint32_t network_;
  uint8_t  prefix_length_;
};

} // namespace dockyard::network
