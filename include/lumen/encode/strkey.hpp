#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <lumen/encode/error.hpp>

namespace lumen::encode {

/**
 * The leading byte of a strkey, which selects the first character of the
 * encoded text (G, S, T and X respectively).
 */
enum class version_byte : std::uint8_t
{
  account     = 6 << 3,
  seed        = 18 << 3,
  pre_auth_tx = 19 << 3,
  sha256_hash = 23 << 3
};

/**
 * Encode a payload as a strkey.
 *
 * The text is the base32 encoding of the version byte, the payload and a
 * little endian CRC16-XModem checksum over both.
 */
std::string encode_check( version_byte version, std::span< const std::byte > payload ) noexcept;

/**
 * Decode a strkey and return its payload.
 *
 * Fails with encode_errc::invalid_version_byte when the text was encoded for
 * a different purpose and encode_errc::checksum_mismatch when the checksum
 * does not match.
 */
result< std::vector< std::byte > > decode_check( version_byte version, std::string_view sv ) noexcept;

std::uint16_t crc16_xmodem( std::span< const std::byte > s ) noexcept;

} // namespace lumen::encode
