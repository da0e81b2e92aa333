#include "Classful.hpp"

#include <glog/logging.h>

int main()
{
  using Classful::address_class;
  using Classful::classify;
  using Classful::resolve;

  CHECK(classify(IP4::parse("0.1.2.3")) == address_class::reserved);
  CHECK(classify(IP4::parse("1.0.0.0")) == address_class::A);
  CHECK(classify(IP4::parse("10.1.2.3")) == address_class::A);
  CHECK(classify(IP4::parse("126.255.255.255")) == address_class::A);
  CHECK(classify(IP4::parse("127.0.0.1")) == address_class::loopback);
  CHECK(classify(IP4::parse("128.0.0.0")) == address_class::B);
  CHECK(classify(IP4::parse("172.16.5.5")) == address_class::B);
  CHECK(classify(IP4::parse("191.255.0.1")) == address_class::B);
  CHECK(classify(IP4::parse("192.0.0.0")) == address_class::C);
  CHECK(classify(IP4::parse("223.1.1.1")) == address_class::C);
  CHECK(classify(IP4::parse("224.0.0.1")) == address_class::D);
  CHECK(classify(IP4::parse("239.255.255.250")) == address_class::D);
  CHECK(classify(IP4::parse("240.0.0.1")) == address_class::E);
  CHECK(classify(IP4::parse("255.255.255.255")) == address_class::E);

  auto const a = resolve(IP4::parse("10.1.2.3"));
  CHECK(a.has_value());
  CHECK_EQ(a->prefix, 8);
  CHECK_EQ(IP4::to_string(a->mask), "255.0.0.0");

  auto const b = resolve(IP4::parse("172.16.5.5"));
  CHECK(b.has_value());
  CHECK_EQ(b->prefix, 16);
  CHECK_EQ(IP4::to_string(b->mask), "255.255.0.0");

  auto const c = resolve(IP4::parse("192.168.1.10"));
  CHECK(c.has_value());
  CHECK_EQ(c->prefix, 24);
  CHECK_EQ(IP4::to_string(c->mask), "255.255.255.0");

  for (auto const none : {"0.0.0.0", "0.255.1.1", "127.0.0.1", "224.0.0.1",
                          "239.0.0.1", "240.0.0.1", "255.255.255.255"}) {
    CHECK(!resolve(IP4::parse(none)).has_value()) << none;
  }

  // Every first octet: a default exists exactly for A, B and C, and it
  // is never /0.
  for (unsigned first = 0; first <= 255; ++first) {
    auto const addr = IP4::address{first << 24};
    auto const cls  = classify(addr);
    auto const dflt = resolve(addr);
    auto const abc  = (cls == address_class::A) || (cls == address_class::B)
                     || (cls == address_class::C);
    CHECK_EQ(dflt.has_value(), abc) << first;
    if (dflt) {
      CHECK_NE(dflt->prefix, 0);
      CHECK_EQ(Mask::to_prefix(dflt->mask), dflt->prefix);
    }
  }

  CHECK_EQ(Classful::to_string(address_class::D), "class D (multicast)");
  CHECK_EQ(Classful::to_string(address_class::loopback), "loopback");
}
