#include <lumen/crypto/hash.hpp>
#include <lumen/encode/base58_check.hpp>

#include <algorithm>
#include <iterator>

namespace lumen::encode {

std::string to_base58_check( std::span< const std::byte > s, base58_alphabet alphabet ) noexcept
{
  auto checksum = crypto::double_sha256( s );

  std::vector< std::byte > data;
  data.reserve( s.size() + base58_checksum_length );
  data.insert( data.end(), s.begin(), s.end() );
  data.insert( data.end(), checksum.begin(), checksum.begin() + base58_checksum_length );

  return to_base58( data, alphabet );
}

result< std::vector< std::byte > > from_base58_check( std::string_view sv, base58_alphabet alphabet ) noexcept
{
  auto decoded = from_base58( sv, alphabet );
  if( !decoded )
    return std::unexpected( decoded.error() );

  if( decoded->size() < base58_checksum_length )
    return std::unexpected( encode_errc::invalid_length );

  const auto payload  = std::span< const std::byte >( *decoded ).first( decoded->size() - base58_checksum_length );
  const auto checksum = crypto::double_sha256( payload );

  if( !std::equal( checksum.begin(), checksum.begin() + base58_checksum_length, decoded->begin() + std::ssize( payload ) ) )
    return std::unexpected( encode_errc::checksum_mismatch );

  decoded->resize( payload.size() );
  return decoded;
}

} // namespace lumen::encode
