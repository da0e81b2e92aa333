#ifndef SUBNET_ERROR_DOT_HPP
#define SUBNET_ERROR_DOT_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace Subnet {

enum class errc : int {
  // address
  malformed_address = 1,
  invalid_octet,
  octet_out_of_range,
  leading_zero,

  // mask
  invalid_prefix_length,
  invalid_cidr,
  invalid_mask,
  unrecognized_mask_spec,
  no_default_mask,
  mask_required,
};

std::error_category const& category() noexcept;

inline std::error_code make_error_code(errc e) noexcept
{
  return std::error_code(static_cast<int>(e), category());
}

// True for the four kinds that come out of address parsing.
inline bool is_address_error(std::error_code const& ec)
{
  return (ec.category() == category())
         && (ec.value() >= static_cast<int>(errc::malformed_address))
         && (ec.value() <= static_cast<int>(errc::leading_zero));
}

char const* name(errc e);

inline std::ostream& operator<<(std::ostream& os, errc e)
{
  return os << name(e);
}

// Thrown by the non-error_code overloads.  Carries the text that failed.

class error : public std::system_error {
public:
  error(std::error_code ec, std::string_view input);

  std::string const& input() const { return input_; }

private:
  std::string input_;
};

} // namespace Subnet

namespace std {
template <>
struct is_error_code_enum<Subnet::errc> : true_type {
};
} // namespace std

#endif // SUBNET_ERROR_DOT_HPP
