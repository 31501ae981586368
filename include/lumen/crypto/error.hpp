#pragma once

#include <expected>
#include <system_error>

namespace lumen::crypto {

enum class crypto_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  initialization_failure,
  invalid_length,
  key_generation_failure,
  signing_failure,
  digest_failure,
  random_failure
};

const std::error_category& crypto_category() noexcept;

std::error_code make_error_code( crypto_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace lumen::crypto

template<>
struct std::is_error_code_enum< lumen::crypto::crypto_errc >: public std::true_type
{};
