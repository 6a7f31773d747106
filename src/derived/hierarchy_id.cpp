#include "derived/hierarchy_id.hpp"

#include <charconv>
#include <cstddef>
#include <string>

namespace monitoring_server::derived {

namespace {

std::optional<std::uint8_t> parse_octet(std::string_view part) noexcept {
  if (part.empty() || part.size() > 3) {
    return std::nullopt;
  }
  if (part.size() > 1 && part.front() == '0') {
    return std::nullopt;
  }
  for (const char c : part) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }

  unsigned int value = 0;
  const auto result = std::from_chars(part.data(), part.data() + part.size(), value);
  if (result.ec != std::errc{} || result.ptr != part.data() + part.size() || value > 255U) {
    return std::nullopt;
  }
  return static_cast<std::uint8_t>(value);
}

std::string group_id(const Ipv4Octets& octets, const unsigned int band) {
  const unsigned int group = (static_cast<unsigned int>(octets[3]) / band) * band;
  return std::to_string(octets[0]) + '.' + std::to_string(octets[1]) + '.' + std::to_string(octets[2]) + '.' +
         std::to_string(group);
}

}  // namespace

InvalidAddress::InvalidAddress(const std::string& address)
    : std::invalid_argument("invalid IPv4 address: " + address), address_(address) {}

std::optional<Ipv4Octets> try_parse_ipv4(std::string_view address) noexcept {
  Ipv4Octets octets{};
  std::size_t index = 0;

  while (index < octets.size()) {
    const auto dot = address.find('.');
    const bool last = index + 1 == octets.size();
    if (last != (dot == std::string_view::npos)) {
      return std::nullopt;
    }

    const auto octet = parse_octet(address.substr(0, dot));
    if (!octet.has_value()) {
      return std::nullopt;
    }
    octets[index++] = *octet;

    if (!last) {
      address.remove_prefix(dot + 1);
    }
  }

  return octets;
}

Ipv4Octets parse_ipv4(std::string_view address) {
  const auto octets = try_parse_ipv4(address);
  if (!octets.has_value()) {
    throw InvalidAddress(std::string(address));
  }
  return *octets;
}

std::string soc_id_for(std::string_view address) {
  return group_id(parse_ipv4(address), 10U);
}

std::string board_id_for(std::string_view address) {
  return group_id(parse_ipv4(address), 100U);
}

HierarchyId derive_hierarchy(std::string_view address) {
  const auto octets = parse_ipv4(address);
  return HierarchyId{group_id(octets, 10U), group_id(octets, 100U)};
}

}  // namespace monitoring_server::derived
