#include "IP4.hpp"

#include "Subnet-error.hpp"

#include <cstring>
#include <iostream>

#include <glog/logging.h>

static_assert(IP4::octet(0xC0A80102, 0) == 192);
static_assert(IP4::octet(0xC0A80102, 3) == 2);
static_assert(IP4::octet(0xC0A80102, 4) == 192);
static_assert(IP4::octet(0xC0A80102, -1) == 2);

int main(int argc, char const* argv[])
{
  using IP4::is_address;
  using IP4::parse;
  using IP4::to_string;
  using Subnet::errc;

  CHECK(is_address("0.0.0.0"));
  CHECK(is_address("69.0.0.0"));
  CHECK(is_address("9.9.9.9"));
  CHECK(is_address("99.99.99.99"));
  CHECK(is_address("255.0.0.1"));
  CHECK(is_address("127.0.0.1"));
  CHECK(is_address("255.255.255.255"));

  CHECK_EQ(parse("10.0.0.1"), 0x0A000001u);
  CHECK_EQ(parse("192.168.1.1"), 0xC0A80101u);
  CHECK_EQ(parse("255.255.255.255"), IP4::max_address);
  CHECK_EQ(parse("0.0.0.0"), 0u);

  CHECK_EQ(to_string(0x0A000001u), "10.0.0.1");
  CHECK_EQ(to_string(0xC0A80101u), "192.168.1.1");
  CHECK_EQ(to_string(0u), "0.0.0.0");
  CHECK_EQ(to_string(IP4::max_address), "255.255.255.255");

  CHECK_EQ(IP4::octet(0xC0A80102u, 0), 192);
  CHECK_EQ(IP4::octet(0xC0A80102u, 1), 168);
  CHECK_EQ(IP4::octet(0xC0A80102u, 2), 1);
  CHECK_EQ(IP4::octet(0xC0A80102u, 3), 2);

  std::error_code ec;

  // Wrong number of segments.
  for (auto const bad : {"", "1.2.3", "1.2.3.4.5", "127.0.0.1.", ".1.2.3",
                         "foo.bar", "1234"}) {
    parse(bad, ec);
    CHECK(ec == errc::malformed_address) << bad << ": " << ec.message();
  }

  // Non-digits or empty octets.
  for (auto const bad : {"1..2.3", "a.b.c.d", "1.2.3.4a", "1.2.-3.4",
                         "1.2.+3.4", " 1.2.3.4", "1.2.3. 4"}) {
    parse(bad, ec);
    CHECK(ec == errc::invalid_octet) << bad << ": " << ec.message();
  }

  for (auto const bad : {"192.168.1.256", "256.0.0.0", "1.300.0.0",
                         "1.1.1000.0", "1.1.1.99999999999999999999"}) {
    parse(bad, ec);
    CHECK(ec == errc::octet_out_of_range) << bad << ": " << ec.message();
  }

  for (auto const bad : {"192.168.01.1", "01.1.1.1", "1.1.1.00", "001.0.0.0"}) {
    parse(bad, ec);
    CHECK(ec == errc::leading_zero) << bad << ": " << ec.message();
  }

  // First failing octet wins.
  parse("300.01.x.0", ec);
  CHECK(ec == errc::octet_out_of_range);

  // Leading zeros are fine when asked for.
  CHECK_EQ(parse("255.255.255.000", ec, IP4::leading_zeros::allow),
           0xFFFFFF00u);
  CHECK(!ec);
  CHECK_EQ(parse("010.001.000.007", ec, IP4::leading_zeros::allow),
           0x0A010007u);
  CHECK(!ec);

  // A good parse clears an earlier error.
  parse("bad", ec);
  CHECK(ec);
  parse("1.2.3.4", ec);
  CHECK(!ec);

  try {
    parse("192.168.01.1");
    LOG(FATAL) << "should have thrown";
  }
  catch (Subnet::error const& ex) {
    CHECK(ex.code() == errc::leading_zero);
    CHECK_EQ(ex.input(), "192.168.01.1");
    CHECK(std::strstr(ex.what(), "«192.168.01.1»") != nullptr);
  }

  // Round trip, boundaries and a walk across the space.
  for (auto const a : {0u, 1u, 0xFFu, 0x100u, 0x7FFFFFFFu, 0x80000000u,
                       0xFFFFFFFEu, 0xFFFFFFFFu}) {
    CHECK_EQ(parse(to_string(a)), a);
  }
  for (uint64_t a = 0; a <= IP4::max_address; a += 0x01010101 / 7) {
    auto const addr = static_cast<IP4::address>(a);
    CHECK_EQ(parse(to_string(addr)), addr) << to_string(addr);
  }

  for (auto arg{1}; arg < argc; ++arg) {
    parse(argv[arg], ec);
    std::cout << argv[arg] << ": " << (ec ? ec.message() : "ok") << '\n';
  }
}
