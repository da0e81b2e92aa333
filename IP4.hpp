#ifndef IP4_DOT_HPP
#define IP4_DOT_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace IP4 {

using address = uint32_t;

// Masks may be typed as "255.255.255.000"; addresses may not.
enum class leading_zeros : bool { reject, allow };

auto parse(std::string_view addr,
           std::error_code& ec,
           leading_zeros    lz = leading_zeros::reject) -> address;

// Throws Subnet::error.
auto parse(std::string_view addr, leading_zeros lz = leading_zeros::reject)
    -> address;

auto is_address(std::string_view addr) -> bool;

auto to_string(address addr) -> std::string;

// Octet 0 is the most significant; n is taken modulo 4.
constexpr auto octet(address addr, int n) -> uint8_t
{
  return static_cast<uint8_t>((addr >> (8 * (3 - (n & 3)))) & 0xFF);
}

constexpr auto max_address{address{0xFFFFFFFF}};

} // namespace IP4

#endif // IP4_DOT_HPP
