#pragma once

#include <expected>
#include <system_error>

namespace lumen::mnemonic {

enum class mnemonic_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  empty_phrase,
  unsupported_language
};

const std::error_category& mnemonic_category() noexcept;

std::error_code make_error_code( mnemonic_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace lumen::mnemonic

template<>
struct std::is_error_code_enum< lumen::mnemonic::mnemonic_errc >: public std::true_type
{};
