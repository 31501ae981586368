#include <lumen/crypto/initialize.hpp>
#include <lumen/crypto/public_key.hpp>
#include <lumen/memory/memory.hpp>

#include <algorithm>

#include <sodium.h>

namespace lumen::crypto {

public_key::public_key( const public_key_data& bytes ) noexcept:
    _bytes( bytes )
{}

bool public_key::operator==( const public_key& rhs ) const noexcept
{
  return _bytes == rhs._bytes;
}

bool public_key::operator!=( const public_key& rhs ) const noexcept
{
  return !( *this == rhs );
}

result< public_key > public_key::from_bytes( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() != public_key_length )
    return std::unexpected( crypto_errc::invalid_length );

  public_key_data data;
  std::ranges::copy( bytes, data.begin() );
  return public_key( data );
}

bool public_key::verify( std::span< const std::byte > sig, std::span< const std::byte > message ) const noexcept
{
  if( sig.size() != signature_length )
    return false;

  if( !initialize() )
    return false;

  return !crypto_sign_verify_detached( memory::pointer_cast< const unsigned char* >( sig.data() ),
                                       memory::pointer_cast< const unsigned char* >( message.data() ),
                                       message.size(),
                                       memory::pointer_cast< const unsigned char* >( _bytes.data() ) );
}

const public_key_data& public_key::bytes() const noexcept
{
  return _bytes;
}

} // namespace lumen::crypto
