#include <lumen/crypto/initialize.hpp>
#include <lumen/crypto/secret_key.hpp>
#include <lumen/memory/memory.hpp>

#include <sodium.h>

namespace lumen::crypto {

secret_key::~secret_key() noexcept
{
  sodium_memzero( _secret_bytes.data(), _secret_bytes.size() );
}

bool secret_key::operator==( const secret_key& rhs ) const noexcept
{
  return !sodium_memcmp( _secret_bytes.data(), rhs._secret_bytes.data(), secret_key_length )
         && _public_bytes == rhs._public_bytes;
}

bool secret_key::operator!=( const secret_key& rhs ) const noexcept
{
  return !( *this == rhs );
}

result< secret_key > secret_key::create() noexcept
{
  return create( system_random() );
}

result< secret_key > secret_key::create( random_source& source ) noexcept
{
  seed_data seed;
  if( auto filled = source.fill( seed ); !filled )
    return std::unexpected( filled.error() );

  auto key = create( seed );
  sodium_memzero( seed.data(), seed.size() );
  return key;
}

result< secret_key > secret_key::create( std::span< const std::byte > seed ) noexcept
{
  if( seed.size() != seed_length )
    return std::unexpected( crypto_errc::invalid_length );

  if( auto init = initialize(); !init )
    return std::unexpected( init.error() );

  secret_key new_key;

  if( crypto_sign_seed_keypair( memory::pointer_cast< unsigned char* >( new_key._public_bytes.data() ),
                                memory::pointer_cast< unsigned char* >( new_key._secret_bytes.data() ),
                                memory::pointer_cast< const unsigned char* >( seed.data() ) )
      != 0 )
    return std::unexpected( crypto_errc::key_generation_failure );

  return new_key;
}

seed_data secret_key::seed() const noexcept
{
  seed_data seed;
  crypto_sign_ed25519_sk_to_seed( memory::pointer_cast< unsigned char* >( seed.data() ),
                                  memory::pointer_cast< const unsigned char* >( _secret_bytes.data() ) );
  return seed;
}

public_key secret_key::public_key() const noexcept
{
  return crypto::public_key( _public_bytes );
}

result< signature > secret_key::sign( std::span< const std::byte > message ) const noexcept
{
  signature sig;

  if( crypto_sign_detached( memory::pointer_cast< unsigned char* >( sig.data() ),
                            nullptr,
                            memory::pointer_cast< const unsigned char* >( message.data() ),
                            message.size(),
                            memory::pointer_cast< const unsigned char* >( _secret_bytes.data() ) )
      != 0 )
    return std::unexpected( crypto_errc::signing_failure );

  return sig;
}

} // namespace lumen::crypto
