#include "IP4.hpp"

#include "Subnet-error.hpp"

#include <charconv>
#include <vector>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::list;
using tao::pegtl::memory_input;
using tao::pegtl::not_one;
using tao::pegtl::nothing;
using tao::pegtl::one;
using tao::pegtl::plus;
using tao::pegtl::seq;
using tao::pegtl::star;

using tao::pegtl::abnf::DIGIT;

namespace IP4 {

using dot = one<'.'>;

// Anything between the dots.  The octet rules are applied after the
// split so each failure can be reported by kind.
struct segment : star<not_one<'.'>> {
};

struct dotted : seq<list<segment, dot>, eof> {
};

struct decimal : seq<plus<DIGIT>, eof> {
};

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<segment> {
  template <typename Input>
  static void apply(Input const& in, std::vector<std::string>& segs)
  {
    segs.push_back(in.string());
  }
};

namespace {
bool is_decimal(std::string_view seg)
{
  memory_input<> in{seg.data(), seg.size(), "octet"};
  return tao::pegtl::parse<decimal>(in);
}

uint8_t octet_value(std::string_view seg, leading_zeros lz, std::error_code& ec)
{
  if (!is_decimal(seg)) {
    ec = Subnet::errc::invalid_octet;
    return 0;
  }

  unsigned val{};
  auto const [ptr, err]
      = std::from_chars(seg.data(), seg.data() + seg.size(), val);
  if ((err != std::errc{}) || (val > 255)) {
    ec = Subnet::errc::octet_out_of_range;
    return 0;
  }

  // "01" could be read as octal by other tools.
  if ((lz == leading_zeros::reject) && (seg.size() > 1) && (seg[0] == '0')) {
    ec = Subnet::errc::leading_zero;
    return 0;
  }

  return static_cast<uint8_t>(val);
}
} // namespace

auto parse(std::string_view addr, std::error_code& ec, leading_zeros lz)
    -> address
{
  ec.clear();

  std::vector<std::string> segs;
  segs.reserve(4);

  memory_input<> in{addr.data(), addr.size(), "addr"};
  if (!tao::pegtl::parse<dotted, action>(in, segs) || (segs.size() != 4)) {
    ec = Subnet::errc::malformed_address;
    return 0;
  }

  address a{0};
  for (auto const& seg : segs) {
    auto const oct = octet_value(seg, lz, ec);
    if (ec)
      return 0;
    a = (a << 8) | oct;
  }
  return a;
}

auto parse(std::string_view addr, leading_zeros lz) -> address
{
  std::error_code ec;
  auto const a = parse(addr, ec, lz);
  if (ec)
    throw Subnet::error(ec, addr);
  return a;
}

auto is_address(std::string_view addr) -> bool
{
  std::error_code ec;
  parse(addr, ec);
  return !ec;
}

auto to_string(address addr) -> std::string
{
  return fmt::format("{}.{}.{}.{}", unsigned(octet(addr, 0)),
                     unsigned(octet(addr, 1)), unsigned(octet(addr, 2)),
                     unsigned(octet(addr, 3)));
}

} // namespace IP4
