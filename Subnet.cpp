#include "Subnet.hpp"

#include "Classful.hpp"

#include <glog/logging.h>

namespace Subnet {

auto to_string(mask_origin origin) -> std::string_view
{
  switch (origin) {
  case mask_origin::explicit_mask: return "mask";
  case mask_origin::explicit_cidr: return "CIDR";
  case mask_origin::classful_default: return "default";
  }
  return "unknown";
}

auto resolve_mask(IP4::address     addr,
                  std::string_view mask_spec,
                  bool             allow_default,
                  std::error_code& ec) -> resolved_mask
{
  ec.clear();

  if (mask_spec.empty() && allow_default) {
    auto const dflt = Classful::resolve(addr);
    if (!dflt) {
      ec = errc::no_default_mask;
      return {};
    }
    return {dflt->mask, dflt->prefix, mask_origin::classful_default};
  }

  if (mask_spec.starts_with('/')) {
    auto const m = Mask::parse_cidr(mask_spec, ec);
    if (ec)
      return {};
    return {m, Mask::to_prefix(m), mask_origin::explicit_cidr};
  }

  if (Mask::is_dotted(mask_spec)) {
    auto const m = Mask::parse_dotted(mask_spec, ec);
    if (ec)
      return {};
    return {m, Mask::to_prefix(m), mask_origin::explicit_mask};
  }

  if (!mask_spec.empty()) {
    ec = errc::unrecognized_mask_spec;
    return {};
  }

  ec = errc::mask_required;
  return {};
}

auto resolve_mask(IP4::address     addr,
                  std::string_view mask_spec,
                  bool             allow_default) -> resolved_mask
{
  std::error_code ec;
  auto const m = resolve_mask(addr, mask_spec, allow_default, ec);
  if (ec) {
    if (ec == errc::no_default_mask)
      throw error(ec, IP4::to_string(addr));
    throw error(ec, mask_spec);
  }
  return m;
}

auto calculate(IP4::address addr, resolved_mask const& m) -> result
{
  CHECK(Mask::is_contiguous(m.mask) && (Mask::to_prefix(m.mask) == m.prefix))
      << "mask " << IP4::to_string(m.mask) << " does not match /" << m.prefix;

  result r{};

  r.address = addr;
  r.mask    = m.mask;
  r.prefix  = m.prefix;
  r.origin  = m.origin;

  r.network    = addr & m.mask;
  r.wildcard   = Mask::wildcard(m.mask);
  r.broadcast  = r.network | r.wildcard;
  r.block_size = uint64_t{r.wildcard} + 1;

  switch (m.prefix) {
  case 32:
    r.first      = r.network;
    r.last       = r.broadcast;
    r.host_count = 1;
    break;

  case 31: // point-to-point, RFC 3021
    r.first      = r.network;
    r.last       = r.broadcast;
    r.host_count = 2;
    break;

  default:
    r.first      = r.network + 1;
    r.last       = r.broadcast - 1;
    r.host_count = (uint64_t{1} << (Mask::max_prefix - m.prefix)) - 2;
    r.gateway    = r.first;
    break;
  }

  auto const next = uint64_t{r.network} + r.block_size;
  if (next <= IP4::max_address)
    r.next_network = static_cast<IP4::address>(next);

  return r;
}

auto compute(std::string_view address,
             std::string_view mask_spec,
             bool             allow_default,
             std::error_code& ec) -> std::optional<result>
{
  auto const addr = IP4::parse(address, ec);
  if (ec)
    return {};

  auto const m = resolve_mask(addr, mask_spec, allow_default, ec);
  if (ec)
    return {};

  return calculate(addr, m);
}

auto compute(std::string_view address,
             std::string_view mask_spec,
             bool             allow_default) -> result
{
  std::error_code ec;
  auto const r = compute(address, mask_spec, allow_default, ec);
  if (ec) {
    if (is_address_error(ec) || (ec == errc::no_default_mask))
      throw error(ec, address);
    throw error(ec, mask_spec);
  }
  return *r;
}

} // namespace Subnet
