#include <lumen/mnemonic/error.hpp>

#include <string>
#include <utility>

namespace lumen::mnemonic {

struct _mnemonic_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "mnemonic";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< mnemonic_errc >( condition ) )
    {
      case mnemonic_errc::ok:
        return "ok"s;
      case mnemonic_errc::empty_phrase:
        return "empty mnemonic phrase"s;
      case mnemonic_errc::unsupported_language:
        return "unsupported mnemonic language"s;
    }
    std::unreachable();
  }
};

const std::error_category& mnemonic_category() noexcept
{
  static _mnemonic_category category;
  return category;
}

std::error_code make_error_code( mnemonic_errc e )
{
  return std::error_code( static_cast< int >( e ), mnemonic_category() );
}

} // namespace lumen::mnemonic
