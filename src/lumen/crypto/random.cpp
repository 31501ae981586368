#include <lumen/crypto/initialize.hpp>
#include <lumen/crypto/random.hpp>

#include <sodium.h>

namespace lumen::crypto {

namespace {

class sodium_random final: public random_source
{
public:
  result< void > fill( std::span< std::byte > buffer ) noexcept final
  {
    if( auto init = initialize(); !init )
      return std::unexpected( init.error() );

    randombytes_buf( buffer.data(), buffer.size() );
    return {};
  }
};

} // namespace

random_source& system_random() noexcept
{
  static sodium_random source;
  return source;
}

} // namespace lumen::crypto
