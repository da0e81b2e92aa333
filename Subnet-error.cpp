#include "Subnet-error.hpp"

#include <fmt/format.h>

namespace {
class subnet_category_impl : public std::error_category {
public:
  char const* name() const noexcept override { return "subnet"; }

  std::string message(int ev) const override
  {
    switch (static_cast<Subnet::errc>(ev)) {
    case Subnet::errc::malformed_address:
      return "address must be four dot separated octets";
    case Subnet::errc::invalid_octet:
      return "address octet is not a decimal number";
    case Subnet::errc::octet_out_of_range:
      return "address octet out of range 0-255";
    case Subnet::errc::leading_zero:
      return "address octet has a leading zero";
    case Subnet::errc::invalid_prefix_length:
      return "prefix length out of range 0-32";
    case Subnet::errc::invalid_cidr:
      return "invalid CIDR prefix";
    case Subnet::errc::invalid_mask:
      return "invalid subnet mask";
    case Subnet::errc::unrecognized_mask_spec:
      return "mask is neither CIDR nor dotted-decimal";
    case Subnet::errc::no_default_mask:
      return "address class has no default mask";
    case Subnet::errc::mask_required:
      return "subnet mask or CIDR prefix required";
    }
    return fmt::format("unknown subnet error {}", ev);
  }
};
} // namespace

namespace Subnet {

std::error_category const& category() noexcept
{
  static subnet_category_impl const cat;
  return cat;
}

char const* name(errc e)
{
  switch (e) {
  case errc::malformed_address: return "malformed_address";
  case errc::invalid_octet: return "invalid_octet";
  case errc::octet_out_of_range: return "octet_out_of_range";
  case errc::leading_zero: return "leading_zero";
  case errc::invalid_prefix_length: return "invalid_prefix_length";
  case errc::invalid_cidr: return "invalid_cidr";
  case errc::invalid_mask: return "invalid_mask";
  case errc::unrecognized_mask_spec: return "unrecognized_mask_spec";
  case errc::no_default_mask: return "no_default_mask";
  case errc::mask_required: return "mask_required";
  }
  return "unknown";
}

error::error(std::error_code ec, std::string_view input)
  : std::system_error(ec, fmt::format("«{}»", input))
  , input_(input)
{
}

} // namespace Subnet
