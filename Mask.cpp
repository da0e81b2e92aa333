#include "Mask.hpp"

#include "IP4.hpp"
#include "Subnet-error.hpp"

#include <bit>
#include <charconv>
#include <string>

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::one;
using tao::pegtl::plus;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::string;

using tao::pegtl::abnf::DIGIT;

namespace Mask {

using dot = one<'.'>;

// 0 to 255, up to three digits, leading zeros allowed.
// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};

struct dotted_mask : seq<dec_octet, dot, dec_octet, dot,
                         dec_octet, dot, dec_octet, eof> {};
// clang-format on

struct prefix_length : seq<plus<DIGIT>, eof> {
};

auto from_prefix(int prefix, std::error_code& ec) -> mask
{
  ec.clear();
  if ((prefix < 0) || (prefix > max_prefix)) {
    ec = Subnet::errc::invalid_prefix_length;
    return 0;
  }
  if (prefix == 0)
    return 0;
  return static_cast<mask>(all_ones << (max_prefix - prefix));
}

auto from_prefix(int prefix) -> mask
{
  std::error_code ec;
  auto const m = from_prefix(prefix, ec);
  if (ec)
    throw Subnet::error(ec, std::to_string(prefix));
  return m;
}

auto to_prefix(mask m) -> int
{
  CHECK(is_contiguous(m)) << "non-contiguous mask " << IP4::to_string(m);
  return std::countl_one(m);
}

auto is_dotted(std::string_view spec) -> bool
{
  memory_input<> in{spec.data(), spec.size(), "mask"};
  return tao::pegtl::parse<dotted_mask>(in);
}

auto parse_dotted(std::string_view spec, std::error_code& ec) -> mask
{
  if (!is_dotted(spec)) {
    ec = Subnet::errc::invalid_mask;
    return 0;
  }

  auto const m = IP4::parse(spec, ec, IP4::leading_zeros::allow);
  if (ec || !is_contiguous(m)) {
    ec = Subnet::errc::invalid_mask;
    return 0;
  }
  return m;
}

auto parse_dotted(std::string_view spec) -> mask
{
  std::error_code ec;
  auto const m = parse_dotted(spec, ec);
  if (ec)
    throw Subnet::error(ec, spec);
  return m;
}

auto parse_cidr(std::string_view spec, std::error_code& ec) -> mask
{
  ec.clear();
  if (spec.empty() || (spec[0] != '/')) {
    ec = Subnet::errc::invalid_cidr;
    return 0;
  }

  auto const digits = spec.substr(1);
  auto const last   = digits.data() + digits.size();

  memory_input<> in{digits.data(), digits.size(), "prefix"};
  if (!tao::pegtl::parse<prefix_length>(in)) {
    ec = Subnet::errc::invalid_cidr;
    return 0;
  }

  int  prefix{};
  auto const [ptr, err] = std::from_chars(digits.data(), last, prefix);
  if ((err != std::errc{}) || (ptr != last)) {
    ec = Subnet::errc::invalid_cidr;
    return 0;
  }

  auto const m = from_prefix(prefix, ec);
  if (ec) {
    ec = Subnet::errc::invalid_cidr;
    return 0;
  }
  return m;
}

auto parse_cidr(std::string_view spec) -> mask
{
  std::error_code ec;
  auto const m = parse_cidr(spec, ec);
  if (ec)
    throw Subnet::error(ec, spec);
  return m;
}

} // namespace Mask
