#include <lumen/identity/error.hpp>

#include <string>
#include <utility>

namespace lumen::identity {

struct _identity_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "identity";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< identity_errc >( condition ) )
    {
      case identity_errc::ok:
        return "ok"s;
      case identity_errc::invalid_seed_length:
        return "seed must be exactly 32 bytes"s;
      case identity_errc::invalid_address_length:
        return "address must decode to exactly 32 bytes"s;
      case identity_errc::no_secret_key:
        return "no secret key available"s;
    }
    std::unreachable();
  }
};

const std::error_category& identity_category() noexcept
{
  static _identity_category category;
  return category;
}

std::error_code make_error_code( identity_errc e )
{
  return std::error_code( static_cast< int >( e ), identity_category() );
}

} // namespace lumen::identity
