#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <lumen/crypto/error.hpp>

namespace lumen::crypto {

result< std::vector< std::byte > > pbkdf2_hmac_sha512( std::span< const std::byte > password,
                                                       std::span< const std::byte > salt,
                                                       std::uint32_t iterations,
                                                       std::size_t length ) noexcept;

} // namespace lumen::crypto
