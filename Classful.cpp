#include "Classful.hpp"

namespace Classful {

auto classify(IP4::address addr) -> address_class
{
  auto const first = IP4::octet(addr, 0);

  if (first == 0)
    return address_class::reserved;
  if (first <= 126)
    return address_class::A;
  if (first == 127)
    return address_class::loopback;
  if (first <= 191)
    return address_class::B;
  if (first <= 223)
    return address_class::C;
  if (first <= 239)
    return address_class::D;
  return address_class::E;
}

auto resolve(IP4::address addr) -> std::optional<default_mask>
{
  switch (classify(addr)) {
  case address_class::A: return default_mask{Mask::from_prefix(8), 8};
  case address_class::B: return default_mask{Mask::from_prefix(16), 16};
  case address_class::C: return default_mask{Mask::from_prefix(24), 24};

  case address_class::reserved:
  case address_class::loopback:
  case address_class::D:
  case address_class::E: break;
  }
  return {};
}

auto to_string(address_class cls) -> std::string_view
{
  switch (cls) {
  case address_class::reserved: return "reserved";
  case address_class::A: return "class A";
  case address_class::loopback: return "loopback";
  case address_class::B: return "class B";
  case address_class::C: return "class C";
  case address_class::D: return "class D (multicast)";
  case address_class::E: return "class E (experimental)";
  }
  return "unknown";
}

} // namespace Classful
