#include "Mask.hpp"

#include "IP4.hpp"
#include "Subnet-error.hpp"

#include <bit>
#include <set>

#include <glog/logging.h>

static_assert(Mask::is_contiguous(0));
static_assert(Mask::is_contiguous(0xFFFFFFFF));
static_assert(Mask::is_contiguous(0xFFFFFF00));
static_assert(!Mask::is_contiguous(0xFF00FF00));
static_assert(Mask::wildcard(0xFFFFFF00) == 0xFF);

int main()
{
  using Subnet::errc;

  std::error_code ec;

  CHECK_EQ(Mask::from_prefix(0), 0u);
  CHECK_EQ(Mask::from_prefix(1), 0x80000000u);
  CHECK_EQ(Mask::from_prefix(8), 0xFF000000u);
  CHECK_EQ(Mask::from_prefix(24), 0xFFFFFF00u);
  CHECK_EQ(Mask::from_prefix(31), 0xFFFFFFFEu);
  CHECK_EQ(Mask::from_prefix(32), 0xFFFFFFFFu);

  for (auto const bad : {-1, 33, 64, -32}) {
    Mask::from_prefix(bad, ec);
    CHECK(ec == errc::invalid_prefix_length) << bad;
  }

  try {
    Mask::from_prefix(33);
    LOG(FATAL) << "should have thrown";
  }
  catch (Subnet::error const& ex) {
    CHECK(ex.code() == errc::invalid_prefix_length);
    CHECK_EQ(ex.input(), "33");
  }

  std::set<Mask::mask> prefix_masks;
  for (auto p{0}; p <= Mask::max_prefix; ++p) {
    auto const m = Mask::from_prefix(p);
    CHECK(Mask::is_contiguous(m)) << p;
    CHECK_EQ(Mask::to_prefix(m), p);
    prefix_masks.insert(m);
  }
  CHECK_EQ(prefix_masks.size(), 33u);

  // is_contiguous agrees with "is one of the prefix masks" everywhere we
  // look: every value with a single run of ones somewhere, plus a walk.
  for (auto len{1}; len <= 32; ++len) {
    for (auto shift{0}; shift + len <= 32; ++shift) {
      auto const run = (len == 32) ? Mask::all_ones
                                   : ((Mask::mask{1} << len) - 1) << shift;
      CHECK_EQ(Mask::is_contiguous(run), prefix_masks.contains(run))
          << IP4::to_string(run);
    }
  }
  for (uint64_t v = 0; v <= Mask::all_ones; v += 0x00F0F0F1) {
    auto const m = static_cast<Mask::mask>(v);
    CHECK_EQ(Mask::is_contiguous(m), prefix_masks.contains(m))
        << IP4::to_string(m);
  }

  for (auto const bad : {"255.0.255.0", "0.255.255.255", "255.255.255.1",
                         "255.255.254.255", "128.0.0.1"}) {
    CHECK(!Mask::is_contiguous(IP4::parse(bad))) << bad;
  }

  // Dotted shape.
  CHECK(Mask::is_dotted("255.255.255.0"));
  CHECK(Mask::is_dotted("255.255.255.000"));
  CHECK(Mask::is_dotted("000.0.0.0"));
  CHECK(Mask::is_dotted("199.249.255.09"));
  CHECK(!Mask::is_dotted("999.0.0.0"));
  CHECK(!Mask::is_dotted("256.0.0.0"));
  CHECK(!Mask::is_dotted("255.260.0.0"));
  CHECK(!Mask::is_dotted("255.255.300.0"));
  CHECK(!Mask::is_dotted("255.255.255"));
  CHECK(!Mask::is_dotted("255.255.255.0.0"));
  CHECK(!Mask::is_dotted("255.255.255.0000"));
  CHECK(!Mask::is_dotted("255.255.255.0 "));
  CHECK(!Mask::is_dotted("/24"));
  CHECK(!Mask::is_dotted(""));

  CHECK_EQ(Mask::parse_dotted("255.255.255.0"), 0xFFFFFF00u);
  CHECK_EQ(Mask::parse_dotted("255.255.255.000"), 0xFFFFFF00u);
  CHECK_EQ(Mask::parse_dotted("255.255.0255.0", ec), 0u);
  CHECK(ec == errc::invalid_mask);
  CHECK_EQ(Mask::parse_dotted("0.0.0.0"), 0u);
  CHECK_EQ(Mask::parse_dotted("255.255.255.255"), 0xFFFFFFFFu);

  for (auto const bad : {"255.0.255.0", "256.0.0.0", "255.255.255.1",
                         "999.0.0.0"}) {
    Mask::parse_dotted(bad, ec);
    CHECK(ec == errc::invalid_mask) << bad;
  }

  try {
    Mask::parse_dotted("255.0.255.0");
    LOG(FATAL) << "should have thrown";
  }
  catch (Subnet::error const& ex) {
    CHECK(ex.code() == errc::invalid_mask);
    CHECK_EQ(ex.input(), "255.0.255.0");
  }

  // CIDR text.
  CHECK_EQ(Mask::parse_cidr("/24"), 0xFFFFFF00u);
  CHECK_EQ(Mask::parse_cidr("/0"), 0u);
  CHECK_EQ(Mask::parse_cidr("/32"), 0xFFFFFFFFu);
  CHECK_EQ(Mask::parse_cidr("/08"), 0xFF000000u);

  // A sign is not a digit, not even on zero.
  for (auto const bad : {"/", "/33", "/-1", "/-0", "/-24", "/24x", "/ 24",
                         "/+24", "/+0", "24", "", "/99999999999999999999"}) {
    Mask::parse_cidr(bad, ec);
    CHECK(ec == errc::invalid_cidr) << bad;
  }

  try {
    Mask::parse_cidr("/33");
    LOG(FATAL) << "should have thrown";
  }
  catch (Subnet::error const& ex) {
    CHECK(ex.code() == errc::invalid_cidr);
    CHECK_EQ(ex.input(), "/33");
  }
}
