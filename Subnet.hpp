#ifndef SUBNET_DOT_HPP
#define SUBNET_DOT_HPP

#include "IP4.hpp"
#include "Mask.hpp"
#include "Subnet-error.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <system_error>

namespace Subnet {

enum class mask_origin : uint8_t {
  explicit_mask,    // dotted-decimal
  explicit_cidr,    // "/n"
  classful_default, // derived from the address class
};

auto to_string(mask_origin origin) -> std::string_view;

inline std::ostream& operator<<(std::ostream& os, mask_origin origin)
{
  return os << to_string(origin);
}

struct resolved_mask {
  Mask::mask  mask;
  int         prefix;
  mask_origin origin;
};

struct result {
  IP4::address address;
  Mask::mask   mask;
  int          prefix;
  mask_origin  origin;

  IP4::address network;
  IP4::address broadcast;
  Mask::mask   wildcard;

  // 2^32 for a /0.
  uint64_t block_size;

  // For /31 these are the two endpoints, for /32 both are the address.
  IP4::address first;
  IP4::address last;

  uint64_t host_count;

  std::optional<IP4::address> next_network; // empty for the last block
  std::optional<IP4::address> gateway;      // empty for /31 and /32

  // False for /31 and /32, where every address is a host.
  bool has_usable_range() const { return prefix <= 30; }
};

// Pick the mask according to the mask spec: empty with allow_default
// uses the classful default, "/n" is CIDR, else a dotted-decimal mask.
auto resolve_mask(IP4::address     addr,
                  std::string_view mask_spec,
                  bool             allow_default,
                  std::error_code& ec) -> resolved_mask;

auto resolve_mask(IP4::address     addr,
                  std::string_view mask_spec,
                  bool             allow_default) -> resolved_mask;

auto calculate(IP4::address addr, resolved_mask const& m) -> result;

auto compute(std::string_view address,
             std::string_view mask_spec,
             bool             allow_default,
             std::error_code& ec) -> std::optional<result>;

// Throws Subnet::error naming the address or mask spec, whichever failed.
auto compute(std::string_view address,
             std::string_view mask_spec,
             bool             allow_default) -> result;

} // namespace Subnet

#endif // SUBNET_DOT_HPP
