#pragma once

#include <span>
#include <vector>

#include <lumen/protocol/error.hpp>
#include <lumen/protocol/types.hpp>

namespace lumen::protocol {

/**
 * Pack a record into its XDR envelope.
 *
 * PublicKey is the big endian key type discriminant followed by the 32 key
 * bytes. DecoratedSignature is the 4 hint bytes followed by the signature as
 * variable length opaque data (big endian length, then the bytes).
 */
std::vector< std::byte > to_xdr( const public_key_record& record ) noexcept;
std::vector< std::byte > to_xdr( const decorated_signature& record ) noexcept;

template< WireRecord T >
result< T > from_xdr( std::span< const std::byte > s ) noexcept;

template<>
result< public_key_record > from_xdr< public_key_record >( std::span< const std::byte > s ) noexcept;

template<>
result< decorated_signature > from_xdr< decorated_signature >( std::span< const std::byte > s ) noexcept;

} // namespace lumen::protocol
