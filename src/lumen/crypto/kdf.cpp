#include <lumen/crypto/kdf.hpp>
#include <lumen/memory/memory.hpp>

#include <limits>

#include <openssl/evp.h>

namespace lumen::crypto {

result< std::vector< std::byte > > pbkdf2_hmac_sha512( std::span< const std::byte > password,
                                                       std::span< const std::byte > salt,
                                                       std::uint32_t iterations,
                                                       std::size_t length ) noexcept
{
  constexpr auto int_max = static_cast< std::size_t >( std::numeric_limits< int >::max() );

  if( !iterations || !length || password.size() > int_max || salt.size() > int_max || length > int_max
      || iterations > int_max )
    return std::unexpected( crypto_errc::invalid_length );

  std::vector< std::byte > out( length );

  if( PKCS5_PBKDF2_HMAC( memory::pointer_cast< const char* >( password.data() ),
                         static_cast< int >( password.size() ),
                         memory::pointer_cast< const unsigned char* >( salt.data() ),
                         static_cast< int >( salt.size() ),
                         static_cast< int >( iterations ),
                         EVP_sha512(),
                         static_cast< int >( out.size() ),
                         memory::pointer_cast< unsigned char* >( out.data() ) )
      != 1 )
    return std::unexpected( crypto_errc::digest_failure );

  return out;
}

} // namespace lumen::crypto
