#include <lumen/encode/base64.hpp>
#include <lumen/memory/memory.hpp>

#include <sodium.h>

namespace lumen::encode {

constexpr int base64_variant = sodium_base64_VARIANT_ORIGINAL;

std::string to_base64( std::span< const std::byte > s ) noexcept
{
  std::string encoded( sodium_base64_ENCODED_LEN( s.size(), base64_variant ), '\0' );
  sodium_bin2base64( encoded.data(),
                     encoded.size(),
                     memory::pointer_cast< const unsigned char* >( s.data() ),
                     s.size(),
                     base64_variant );

  // Drop the terminator written by libsodium
  encoded.pop_back();
  return encoded;
}

result< std::vector< std::byte > > from_base64( std::string_view sv ) noexcept
{
  std::vector< std::byte > bytes( sv.size() / 4 * 3 + 3 );
  std::size_t length    = 0;
  const char* remainder = nullptr;

  if( sodium_base642bin( memory::pointer_cast< unsigned char* >( bytes.data() ),
                         bytes.size(),
                         sv.data(),
                         sv.size(),
                         nullptr,
                         &length,
                         &remainder,
                         base64_variant )
      != 0 )
    return std::unexpected( sv.size() % 4 ? encode_errc::invalid_length : encode_errc::invalid_character );

  if( remainder != sv.data() + sv.size() )
    return std::unexpected( encode_errc::invalid_character );

  bytes.resize( length );
  return bytes;
}

} // namespace lumen::encode
