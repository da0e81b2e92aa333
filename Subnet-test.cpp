#include "Subnet.hpp"

#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

#include <glog/logging.h>

using Subnet::errc;
using Subnet::mask_origin;

namespace {
std::string ip(IP4::address a) { return IP4::to_string(a); }

void check_error(char const* address,
                 char const* mask_spec,
                 bool        allow_default,
                 errc        expected,
                 char const* expected_input)
{
  std::error_code ec;
  auto const r = Subnet::compute(address, mask_spec, allow_default, ec);
  CHECK(!r.has_value()) << address << " " << mask_spec;
  CHECK(ec == expected) << address << " «" << mask_spec << "» got "
                        << ec.message();

  try {
    Subnet::compute(address, mask_spec, allow_default);
    LOG(FATAL) << "should have thrown for " << address << " " << mask_spec;
  }
  catch (Subnet::error const& ex) {
    CHECK(ex.code() == expected);
    CHECK_EQ(ex.input(), expected_input);
  }
}

// Run calculate() in a child; true if it died on a failed CHECK.
bool calculate_aborts(Subnet::resolved_mask const& m)
{
  auto const pid = fork();
  PCHECK(pid != -1);
  if (pid == 0) {
    Subnet::calculate(IP4::parse("10.0.0.1"), m);
    _exit(0);
  }
  int status{};
  PCHECK(waitpid(pid, &status, 0) == pid);
  return WIFSIGNALED(status) && (WTERMSIG(status) == SIGABRT);
}

void check_invariants(Subnet::result const& r)
{
  CHECK_LE(r.network, r.broadcast);
  CHECK_EQ(r.network, r.address & r.mask);
  CHECK_EQ(r.broadcast, r.network | r.wildcard);
  CHECK_EQ(r.wildcard, ~r.mask);
  CHECK_EQ(Mask::to_prefix(r.mask), r.prefix);
  CHECK_EQ(r.block_size, uint64_t{1} << (32 - r.prefix));
  CHECK_LE(r.network, r.first);
  CHECK_LE(r.first, r.last);
  CHECK_LE(r.last, r.broadcast);
  CHECK_EQ(r.gateway.has_value(), r.has_usable_range());
  CHECK_EQ(r.next_network.has_value(), r.broadcast != IP4::max_address);
  if (r.next_network)
    CHECK_EQ(*r.next_network, r.broadcast + 1);
}
} // namespace

int main()
{
  {
    auto const r = Subnet::compute("10.0.0.1", "/24", false);
    check_invariants(r);
    CHECK_EQ(ip(r.address), "10.0.0.1");
    CHECK_EQ(ip(r.network), "10.0.0.0");
    CHECK_EQ(ip(r.broadcast), "10.0.0.255");
    CHECK_EQ(ip(r.first), "10.0.0.1");
    CHECK_EQ(ip(r.last), "10.0.0.254");
    CHECK_EQ(r.host_count, 254u);
    CHECK(r.next_network.has_value());
    CHECK_EQ(ip(*r.next_network), "10.0.1.0");
    CHECK(r.gateway.has_value());
    CHECK_EQ(ip(*r.gateway), "10.0.0.1");
    CHECK_EQ(ip(r.mask), "255.255.255.0");
    CHECK_EQ(r.prefix, 24);
    CHECK(r.origin == mask_origin::explicit_cidr);
  }

  {
    auto const r = Subnet::compute("192.168.1.0", "/31", false);
    check_invariants(r);
    CHECK_EQ(ip(r.first), "192.168.1.0");
    CHECK_EQ(ip(r.last), "192.168.1.1");
    CHECK_EQ(r.host_count, 2u);
    CHECK(!r.gateway.has_value());
    CHECK(!r.has_usable_range());
  }

  {
    auto const r = Subnet::compute("10.10.10.10", "/32", false);
    check_invariants(r);
    CHECK_EQ(ip(r.network), "10.10.10.10");
    CHECK_EQ(ip(r.broadcast), "10.10.10.10");
    CHECK_EQ(ip(r.first), "10.10.10.10");
    CHECK_EQ(ip(r.last), "10.10.10.10");
    CHECK_EQ(r.host_count, 1u);
    CHECK_EQ(r.block_size, 1u);
    CHECK(!r.gateway.has_value());
    CHECK(r.next_network.has_value());
    CHECK_EQ(ip(*r.next_network), "10.10.10.11");
  }

  {
    auto const r = Subnet::compute("255.255.255.0", "/24", false);
    check_invariants(r);
    CHECK(!r.next_network.has_value());
    CHECK_EQ(ip(r.broadcast), "255.255.255.255");
  }

  {
    auto const r = Subnet::compute("255.255.255.255", "/32", false);
    check_invariants(r);
    CHECK(!r.next_network.has_value());
  }

  { // The whole space.
    auto const r = Subnet::compute("8.8.8.8", "/0", false);
    check_invariants(r);
    CHECK_EQ(ip(r.network), "0.0.0.0");
    CHECK_EQ(ip(r.broadcast), "255.255.255.255");
    CHECK_EQ(ip(r.first), "0.0.0.1");
    CHECK_EQ(ip(r.last), "255.255.255.254");
    CHECK_EQ(r.block_size, uint64_t{1} << 32);
    CHECK_EQ(r.host_count, (uint64_t{1} << 32) - 2);
    CHECK(!r.next_network.has_value());
  }

  {
    auto const r = Subnet::compute("8.8.8.8", "0.0.0.0", false);
    CHECK_EQ(r.prefix, 0);
    CHECK(r.origin == mask_origin::explicit_mask);
  }

  {
    auto const r = Subnet::compute("200.1.2.3", "/1", false);
    check_invariants(r);
    CHECK_EQ(ip(r.network), "128.0.0.0");
    CHECK_EQ(r.host_count, (uint64_t{1} << 31) - 2);
    CHECK(!r.next_network.has_value());

    auto const lower = Subnet::compute("100.1.2.3", "/1", false);
    CHECK(lower.next_network.has_value());
    CHECK_EQ(ip(*lower.next_network), "128.0.0.0");
  }

  {
    auto const r = Subnet::compute("192.168.1.77", "/30", false);
    check_invariants(r);
    CHECK_EQ(ip(r.network), "192.168.1.76");
    CHECK_EQ(ip(r.first), "192.168.1.77");
    CHECK_EQ(ip(r.last), "192.168.1.78");
    CHECK_EQ(r.host_count, 2u);
  }

  { // Dotted mask, with and without leading zeros.
    auto const r = Subnet::compute("172.16.200.9", "255.255.240.0", false);
    check_invariants(r);
    CHECK_EQ(r.prefix, 20);
    CHECK(r.origin == mask_origin::explicit_mask);
    CHECK_EQ(ip(r.network), "172.16.192.0");
    CHECK_EQ(ip(r.broadcast), "172.16.207.255");
    CHECK_EQ(r.host_count, 4094u);

    auto const z = Subnet::compute("172.16.200.9", "255.255.240.000", false);
    CHECK_EQ(ip(z.mask), "255.255.240.0");
    CHECK_EQ(z.prefix, 20);
  }

  { // Classful defaults.
    auto const b = Subnet::compute("172.16.5.5", "", true);
    check_invariants(b);
    CHECK_EQ(b.prefix, 16);
    CHECK_EQ(ip(b.mask), "255.255.0.0");
    CHECK(b.origin == mask_origin::classful_default);
    CHECK_EQ(ip(b.network), "172.16.0.0");
    CHECK_EQ(b.host_count, 65534u);

    auto const a = Subnet::compute("10.1.2.3", "", true);
    CHECK_EQ(a.prefix, 8);
    auto const c = Subnet::compute("192.168.1.10", "", true);
    CHECK_EQ(c.prefix, 24);

    // An explicit mask wins over the default.
    auto const x = Subnet::compute("10.1.2.3", "/30", true);
    CHECK_EQ(x.prefix, 30);
    CHECK(x.origin == mask_origin::explicit_cidr);
  }

  // Errors, with the input each one names.
  check_error("224.0.0.1", "", true, errc::no_default_mask, "224.0.0.1");
  check_error("127.0.0.1", "", true, errc::no_default_mask, "127.0.0.1");
  check_error("0.1.2.3", "", true, errc::no_default_mask, "0.1.2.3");
  check_error("240.0.0.1", "", true, errc::no_default_mask, "240.0.0.1");

  check_error("192.168.1.256", "/24", false, errc::octet_out_of_range,
              "192.168.1.256");
  check_error("192.168.01.1", "/24", false, errc::leading_zero,
              "192.168.01.1");
  check_error("192.168.1", "/24", false, errc::malformed_address, "192.168.1");
  check_error("192.168.x.1", "/24", false, errc::invalid_octet, "192.168.x.1");
  check_error("", "/24", false, errc::malformed_address, "");

  // Address errors come before mask errors.
  check_error("1.2.3.999", "255.0.255.0", false, errc::octet_out_of_range,
              "1.2.3.999");

  check_error("10.0.0.1", "255.0.255.0", false, errc::invalid_mask,
              "255.0.255.0");
  // Out of range octets mean the text is not a dotted mask at all.
  check_error("10.0.0.1", "256.0.0.0", false, errc::unrecognized_mask_spec,
              "256.0.0.0");
  check_error("10.0.0.1", "999.0.0.0", false, errc::unrecognized_mask_spec,
              "999.0.0.0");
  check_error("10.0.0.1", "/33", false, errc::invalid_cidr, "/33");
  check_error("10.0.0.1", "/", false, errc::invalid_cidr, "/");
  check_error("10.0.0.1", "/-0", false, errc::invalid_cidr, "/-0");
  check_error("10.0.0.1", "/abc", true, errc::invalid_cidr, "/abc");
  check_error("10.0.0.1", "banana", false, errc::unrecognized_mask_spec,
              "banana");
  check_error("10.0.0.1", "24", false, errc::unrecognized_mask_spec, "24");
  check_error("10.0.0.1", "255.255.255", true, errc::unrecognized_mask_spec,
              "255.255.255");
  check_error("10.0.0.1", "", false, errc::mask_required, "");

  { // Stages on their own.
    std::error_code ec;
    auto const addr = IP4::parse("10.9.8.7");
    auto const m    = Subnet::resolve_mask(addr, "/16", false, ec);
    CHECK(!ec);
    CHECK_EQ(m.prefix, 16);
    auto const r = Subnet::calculate(addr, m);
    CHECK_EQ(ip(r.network), "10.9.0.0");

    Subnet::resolve_mask(addr, "", false, ec);
    CHECK(ec == errc::mask_required);
  }

  { // Every prefix on one address.
    auto const addr = IP4::parse("203.0.113.77");
    for (auto p{0}; p <= 32; ++p) {
      auto const r = Subnet::calculate(
          addr, {Mask::from_prefix(p), p, mask_origin::explicit_cidr});
      check_invariants(r);
      switch (p) {
      case 32: CHECK_EQ(r.host_count, 1u); break;
      case 31: CHECK_EQ(r.host_count, 2u); break;
      default: CHECK_EQ(r.host_count, (uint64_t{1} << (32 - p)) - 2); break;
      }
    }
  }

  { // Prefix and mask must agree, and the mask must be contiguous.
    auto const cidr = mask_origin::explicit_cidr;
    CHECK(!calculate_aborts({Mask::from_prefix(24), 24, cidr}));
    CHECK(calculate_aborts({Mask::from_prefix(24), 16, cidr}));
    CHECK(calculate_aborts({Mask::from_prefix(8), 40, cidr}));
    CHECK(calculate_aborts({Mask::from_prefix(8), -1, cidr}));
    CHECK(calculate_aborts({0xFF00FF00, 16, mask_origin::explicit_mask}));
  }

  CHECK_EQ(Subnet::to_string(mask_origin::explicit_mask), "mask");
  CHECK_EQ(Subnet::to_string(mask_origin::classful_default), "default");

  std::error_code ec = errc::invalid_mask;
  CHECK_EQ(std::strcmp(ec.category().name(), "subnet"), 0);
  CHECK_EQ(ec.message(), "invalid subnet mask");
  std::ostringstream os;
  os << errc::no_default_mask;
  CHECK_EQ(os.str(), "no_default_mask");
}
