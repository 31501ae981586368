#include <lumen/protocol/error.hpp>

#include <string>
#include <utility>

namespace lumen::protocol {

struct _protocol_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "protocol";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< protocol_errc >( condition ) )
    {
      case protocol_errc::ok:
        return "ok"s;
      case protocol_errc::unexpected_end_of_data:
        return "unexpected end of data"s;
      case protocol_errc::unknown_key_type:
        return "unknown key type"s;
      case protocol_errc::invalid_signature_length:
        return "invalid signature length"s;
      case protocol_errc::trailing_data:
        return "trailing data"s;
    }
    std::unreachable();
  }
};

const std::error_category& protocol_category() noexcept
{
  static _protocol_category category;
  return category;
}

std::error_code make_error_code( protocol_errc e )
{
  return std::error_code( static_cast< int >( e ), protocol_category() );
}

} // namespace lumen::protocol
