#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace monitoring_server::derived {

class InvalidAddress : public std::invalid_argument {
 public:
  explicit InvalidAddress(const std::string& address);

  [[nodiscard]] const std::string& address() const noexcept { return address_; }

 private:
  std::string address_;
};

using Ipv4Octets = std::array<std::uint8_t, 4>;

struct HierarchyId {
  std::string soc_id;
  std::string board_id;
};

// Strict dotted-decimal: four parts, 0..255, no sign, no leading zeros.
std::optional<Ipv4Octets> try_parse_ipv4(std::string_view address) noexcept;

// Throws InvalidAddress.
Ipv4Octets parse_ipv4(std::string_view address);

// a.b.c.(d/10*10)
std::string soc_id_for(std::string_view address);

// a.b.c.(d/100*100)
std::string board_id_for(std::string_view address);

HierarchyId derive_hierarchy(std::string_view address);

}  // namespace monitoring_server::derived
