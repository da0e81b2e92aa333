#ifndef CLASSFUL_DOT_HPP
#define CLASSFUL_DOT_HPP

#include "IP4.hpp"
#include "Mask.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

// Pre-CIDR address classes, keyed on the first octet.

namespace Classful {

enum class address_class : uint8_t {
  reserved, // 0.x.x.x
  A,
  loopback, // 127.x.x.x
  B,
  C,
  D, // multicast
  E, // experimental
};

struct default_mask {
  Mask::mask mask;
  int        prefix;
};

auto classify(IP4::address addr) -> address_class;

// Nothing for reserved, loopback, D and E.  Never yields /0.
auto resolve(IP4::address addr) -> std::optional<default_mask>;

auto to_string(address_class cls) -> std::string_view;

inline std::ostream& operator<<(std::ostream& os, address_class cls)
{
  return os << to_string(cls);
}

} // namespace Classful

#endif // CLASSFUL_DOT_HPP
