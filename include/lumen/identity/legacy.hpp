#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include <lumen/identity/error.hpp>
#include <lumen/identity/keypair.hpp>

/**
 * Base58 encodings used by the legacy network.
 *
 * These exist only to migrate old accounts to strkey encoding. Every call
 * reports a deprecation_notice through the installed handler.
 */
namespace lumen::identity::legacy {

constexpr std::byte address_version{ 0 };
constexpr std::byte seed_version{ 33 };

struct deprecation_notice
{
  std::string_view operation;
  std::string_view replacement;
};

using deprecation_handler = std::function< void( const deprecation_notice& ) >;

/**
 * Install the handler that receives deprecation notices, replacing the
 * previous one. An empty handler restores the default, which logs a warning.
 *
 * The handler may be called concurrently and must not throw.
 */
void set_deprecation_handler( deprecation_handler handler );

/**
 * Decode a base58check seed.
 *
 * Stricter than the legacy network's decoder, which dropped the first byte
 * unchecked: a prefix other than seed_version fails with
 * encode_errc::invalid_version_byte, so an account id or other payload is
 * never taken for a seed.
 */
result< keypair > from_seed( std::string_view seed ) noexcept;

/**
 * The legacy account id, base58check( 0x00 || ripemd160( sha256( public key ) ) ).
 *
 * This is a one way hash of the public key and cannot be decoded back into
 * a keypair.
 */
result< std::string > address( const keypair& kp ) noexcept;

/**
 * base58check( 33 || seed ), the inverse of from_seed().
 */
result< std::string > seed( const keypair& kp ) noexcept;

} // namespace lumen::identity::legacy
