#pragma once

#include <expected>
#include <system_error>

namespace lumen::protocol {

enum class protocol_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unexpected_end_of_data,
  unknown_key_type,
  invalid_signature_length,
  trailing_data
};

const std::error_category& protocol_category() noexcept;

std::error_code make_error_code( protocol_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace lumen::protocol

template<>
struct std::is_error_code_enum< lumen::protocol::protocol_errc >: public std::true_type
{};
