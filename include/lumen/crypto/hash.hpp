#pragma once

#include <array>
#include <cstddef>
#include <span>

#include <lumen/crypto/error.hpp>

namespace lumen::crypto {

constexpr std::size_t sha256_length    = 32;
constexpr std::size_t ripemd160_length = 20;

using sha256_digest    = std::array< std::byte, sha256_length >;
using ripemd160_digest = std::array< std::byte, ripemd160_length >;

sha256_digest sha256( std::span< const std::byte > s ) noexcept;

/**
 * sha256( sha256( s ) ), the checksum hash of the legacy base58check format.
 */
sha256_digest double_sha256( std::span< const std::byte > s ) noexcept;

result< ripemd160_digest > ripemd160( std::span< const std::byte > s ) noexcept;

/**
 * ripemd160( sha256( s ) )
 */
result< ripemd160_digest > hash160( std::span< const std::byte > s ) noexcept;

} // namespace lumen::crypto
