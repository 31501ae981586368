#pragma once

#include <expected>
#include <system_error>

namespace lumen::identity {

enum class identity_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_seed_length,
  invalid_address_length,
  no_secret_key
};

const std::error_category& identity_category() noexcept;

std::error_code make_error_code( identity_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace lumen::identity

template<>
struct std::is_error_code_enum< lumen::identity::identity_errc >: public std::true_type
{};
