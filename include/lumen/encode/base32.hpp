#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <lumen/encode/error.hpp>

namespace lumen::encode {

/**
 * RFC 4648 base32 using the upper case alphabet.
 *
 * Encoding always pads to a multiple of eight characters. Decoding accepts
 * padded and unpadded input but rejects encodings whose trailing bits are
 * not zero.
 */
std::string to_base32( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_base32( std::string_view sv ) noexcept;

} // namespace lumen::encode
