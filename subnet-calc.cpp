// Command line front end: subnet-calc [flags] ADDRESS [MASK]

#include "Classful.hpp"
#include "IP4.hpp"
#include "Subnet.hpp"

#include <iostream>
#include <string>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <boost/algorithm/string/trim.hpp>

template <>
struct fmt::formatter<Classful::address_class> : ostream_formatter {};
template <>
struct fmt::formatter<Subnet::mask_origin> : ostream_formatter {};

DEFINE_string(mask, "", "subnet mask, dotted-decimal (255.255.255.0) or CIDR (/24)");
DEFINE_bool(use_default_mask,
            false,
            "use the classful default mask when no mask is given");
DEFINE_bool(show_class, true, "print the address class");

namespace {
std::string with_separators(uint64_t n)
{
  auto digits{std::to_string(n)};
  for (auto pos = static_cast<int>(digits.size()) - 3; pos > 0; pos -= 3)
    digits.insert(static_cast<size_t>(pos), 1, ',');
  return digits;
}

std::string error_message(std::string const&     address,
                          std::string const&     mask_spec,
                          std::error_code const& ec)
{
  using Subnet::errc;

  if (Subnet::is_address_error(ec))
    return fmt::format("IP address «{}» is not valid: {}", address,
                       ec.message());

  if (ec == errc::no_default_mask) {
    auto const cls = Classful::classify(IP4::parse(address));
    if ((cls == Classful::address_class::D)
        || (cls == Classful::address_class::E))
      return fmt::format("no default mask for multicast/experimental "
                         "(class D/E) address «{}», please give a mask",
                         address);
    return fmt::format("no default mask for loopback/reserved address «{}», "
                       "please give a mask",
                       address);
  }

  if (ec == errc::invalid_cidr)
    return fmt::format("CIDR prefix «{}» is not valid", mask_spec);

  if (ec == errc::invalid_mask)
    return fmt::format("subnet mask «{}» is not valid (must be dotted-decimal "
                       "with contiguous one bits)",
                       mask_spec);

  if (ec == errc::unrecognized_mask_spec)
    return fmt::format("subnet mask / CIDR «{}» not understood", mask_spec);

  if (ec == errc::mask_required)
    return "please give a subnet mask / CIDR, or use --use_default_mask";

  return ec.message();
}

void print(Subnet::result const& r)
{
  auto const ip = [](IP4::address a) { return IP4::to_string(a); };

  std::string first = ip(r.first);
  std::string last  = ip(r.last);
  std::string gateway;

  switch (r.prefix) {
  case 31:
    first += " (point-to-point)";
    last += " (point-to-point)";
    gateway = "not applicable (/31)";
    break;
  case 32:
    first   = fmt::format("same as network address ({})", ip(r.first));
    last    = fmt::format("same as network address ({})", ip(r.last));
    gateway = "not applicable (/32)";
    break;
  default:
    gateway = ip(*r.gateway);
    break;
  }

  auto const next
      = r.next_network ? ip(*r.next_network) : std::string("none (last block)");

  if (FLAGS_show_class)
    fmt::print("Address:      {} ({})\n", ip(r.address),
               Classful::classify(r.address));
  else
    fmt::print("Address:      {}\n", ip(r.address));
  fmt::print("Network:      {}\n", ip(r.network));
  fmt::print("Subnet mask:  {} / {} ({})\n", ip(r.mask), r.prefix, r.origin);
  fmt::print("First usable: {}\n", first);
  fmt::print("Last usable:  {}\n", last);
  fmt::print("Broadcast:    {}\n", ip(r.broadcast));
  fmt::print("Next network: {}\n", next);
  fmt::print("Usable hosts: {}\n", with_separators(r.host_count));
  fmt::print("Gateway:      {}\n", gateway);
}
} // namespace

int main(int argc, char* argv[])
{
  std::ios::sync_with_stdio(false);

  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    SetUsageMessage("subnet-calc [flags] ADDRESS [MASK]");
    ParseCommandLineFlags(&argc, &argv, true);
  }

  google::InitGoogleLogging(argv[0]);

  if ((argc < 2) || (argc > 3)) {
    std::cerr << "usage: " << argv[0] << " [flags] ADDRESS [MASK]\n";
    return 2;
  }

  auto const address = boost::algorithm::trim_copy(std::string(argv[1]));
  auto const mask_spec
      = boost::algorithm::trim_copy(std::string(argc == 3 ? argv[2] : FLAGS_mask));

  if (address.empty()) {
    std::cerr << "please enter an IP address\n";
    return 2;
  }

  LOG(INFO) << "address «" << address << "» mask «" << mask_spec
            << "» use_default_mask=" << std::boolalpha
            << FLAGS_use_default_mask;

  std::error_code ec;
  auto const r
      = Subnet::compute(address, mask_spec, FLAGS_use_default_mask, ec);
  if (!r) {
    auto const msg = error_message(address, mask_spec, ec);
    LOG(ERROR) << msg << " [" << static_cast<Subnet::errc>(ec.value()) << "]";
    std::cerr << msg << '\n';
    return 1;
  }

  LOG(INFO) << "resolved mask " << IP4::to_string(r->mask) << "/" << r->prefix
            << " from " << r->origin;
  VLOG(1) << "network " << IP4::to_string(r->network) << " broadcast "
          << IP4::to_string(r->broadcast) << " hosts " << r->host_count;

  print(*r);
}
