#include <lumen/crypto/error.hpp>

#include <string>
#include <utility>

namespace lumen::crypto {

struct _crypto_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "crypto";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< crypto_errc >( condition ) )
    {
      case crypto_errc::ok:
        return "ok"s;
      case crypto_errc::initialization_failure:
        return "cryptographic library initialization failed"s;
      case crypto_errc::invalid_length:
        return "invalid length"s;
      case crypto_errc::key_generation_failure:
        return "key generation failed"s;
      case crypto_errc::signing_failure:
        return "signing failed"s;
      case crypto_errc::digest_failure:
        return "digest computation failed"s;
      case crypto_errc::random_failure:
        return "random number generation failed"s;
    }
    std::unreachable();
  }
};

const std::error_category& crypto_category() noexcept
{
  static _crypto_category category;
  return category;
}

std::error_code make_error_code( crypto_errc e )
{
  return std::error_code( static_cast< int >( e ), crypto_category() );
}

} // namespace lumen::crypto
