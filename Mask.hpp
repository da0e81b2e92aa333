#ifndef MASK_DOT_HPP
#define MASK_DOT_HPP

#include <cstdint>
#include <string_view>
#include <system_error>

namespace Mask {

using mask = uint32_t;

constexpr auto all_ones{mask{0xFFFFFFFF}};
constexpr auto max_prefix{32};

// A mask is a run of one bits from the top followed by a run of zero
// bits, either run possibly empty.  For such a mask the complement
// plus one is a single bit.
constexpr auto is_contiguous(mask m) -> bool
{
  if ((m == 0) || (m == all_ones))
    return true;
  auto const inv_plus_one = static_cast<mask>(~m + 1u);
  return (inv_plus_one != 0) && ((inv_plus_one & (inv_plus_one - 1)) == 0);
}

constexpr auto wildcard(mask m) -> mask { return static_cast<mask>(~m); }

auto from_prefix(int prefix, std::error_code& ec) -> mask;
auto from_prefix(int prefix) -> mask;

// Caller must have checked is_contiguous().
auto to_prefix(mask m) -> int;

// Four dot separated groups of one to three digits, each 0 to 255.
auto is_dotted(std::string_view spec) -> bool;

// Dotted-decimal mask; leading zeros in an octet are tolerated.
auto parse_dotted(std::string_view spec, std::error_code& ec) -> mask;
auto parse_dotted(std::string_view spec) -> mask;

// "/24" and the like.
auto parse_cidr(std::string_view spec, std::error_code& ec) -> mask;
auto parse_cidr(std::string_view spec) -> mask;

} // namespace Mask

#endif // MASK_DOT_HPP
