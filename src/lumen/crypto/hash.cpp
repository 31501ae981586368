#include <lumen/crypto/hash.hpp>
#include <lumen/memory/memory.hpp>

#include <openssl/evp.h>
#include <sodium.h>

namespace lumen::crypto {

sha256_digest sha256( std::span< const std::byte > s ) noexcept
{
  sha256_digest out;
  crypto_hash_sha256( memory::pointer_cast< unsigned char* >( out.data() ),
                      memory::pointer_cast< const unsigned char* >( s.data() ),
                      s.size() );
  return out;
}

sha256_digest double_sha256( std::span< const std::byte > s ) noexcept
{
  auto first = sha256( s );
  return sha256( first );
}

result< ripemd160_digest > ripemd160( std::span< const std::byte > s ) noexcept
{
  ripemd160_digest out;
  unsigned int length = 0;

  if( EVP_Digest( s.data(),
                  s.size(),
                  memory::pointer_cast< unsigned char* >( out.data() ),
                  &length,
                  EVP_ripemd160(),
                  nullptr )
        != 1
      || length != out.size() )
    return std::unexpected( crypto_errc::digest_failure );

  return out;
}

result< ripemd160_digest > hash160( std::span< const std::byte > s ) noexcept
{
  auto digest = sha256( s );
  return ripemd160( digest );
}

} // namespace lumen::crypto
