#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <lumen/encode/base58.hpp>
#include <lumen/encode/error.hpp>

namespace lumen::encode {

constexpr std::size_t base58_checksum_length = 4;

/**
 * Base58 encode the payload followed by the first four bytes of its double
 * SHA-256.
 */
std::string to_base58_check( std::span< const std::byte > s,
                             base58_alphabet alphabet = base58_alphabet::bitcoin ) noexcept;

result< std::vector< std::byte > > from_base58_check( std::string_view sv,
                                                      base58_alphabet alphabet = base58_alphabet::bitcoin ) noexcept;

} // namespace lumen::encode
