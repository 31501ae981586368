#include <lumen/crypto/initialize.hpp>

#include <sodium.h>

namespace lumen::crypto {

result< void > initialize() noexcept
{
  static const int retcode = sodium_init();

  if( retcode < 0 )
    return std::unexpected( crypto_errc::initialization_failure );

  return {};
}

} // namespace lumen::crypto
