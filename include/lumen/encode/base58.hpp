#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <lumen/encode/error.hpp>

namespace lumen::encode {

enum class base58_alphabet : int // NOLINT(performance-enum-size)
{
  bitcoin,
  stellar
};

std::string to_base58( std::span< const std::byte > s, base58_alphabet alphabet = base58_alphabet::bitcoin ) noexcept;
result< std::vector< std::byte > > from_base58( std::string_view sv,
                                                base58_alphabet alphabet = base58_alphabet::bitcoin ) noexcept;

} // namespace lumen::encode
