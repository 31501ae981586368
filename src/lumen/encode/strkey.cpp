#include <lumen/encode/base32.hpp>
#include <lumen/encode/strkey.hpp>

#include <utility>

namespace lumen::encode {

constexpr std::uint16_t crc16_polynomial = 0x1021;
constexpr std::uint16_t crc16_high_bit   = 0x8000;
constexpr std::size_t checksum_length    = 2;
constexpr std::uint32_t byte_bits        = 8;

std::uint16_t crc16_xmodem( std::span< const std::byte > s ) noexcept
{
  std::uint16_t crc = 0;

  for( const auto& b: s )
  {
    crc ^= static_cast< std::uint16_t >( std::to_integer< std::uint16_t >( b ) << byte_bits );
    for( std::uint32_t i = 0; i < byte_bits; ++i )
    {
      if( crc & crc16_high_bit )
        crc = static_cast< std::uint16_t >( crc << 1 ^ crc16_polynomial );
      else
        crc = static_cast< std::uint16_t >( crc << 1 );
    }
  }

  return crc;
}

std::string encode_check( version_byte version, std::span< const std::byte > payload ) noexcept
{
  std::vector< std::byte > data;
  data.reserve( 1 + payload.size() + checksum_length );
  data.push_back( std::byte{ std::to_underlying( version ) } );
  data.insert( data.end(), payload.begin(), payload.end() );

  auto checksum = crc16_xmodem( data );
  data.push_back( static_cast< std::byte >( checksum & 0xff ) );
  data.push_back( static_cast< std::byte >( checksum >> byte_bits ) );

  return to_base32( data );
}

result< std::vector< std::byte > > decode_check( version_byte version, std::string_view sv ) noexcept
{
  auto decoded = from_base32( sv );
  if( !decoded )
    return std::unexpected( decoded.error() );

  auto& data = *decoded;
  if( data.size() < 1 + checksum_length )
    return std::unexpected( encode_errc::invalid_length );

  if( data.front() != std::byte{ std::to_underlying( version ) } )
    return std::unexpected( encode_errc::invalid_version_byte );

  const auto body = std::span< const std::byte >( data ).first( data.size() - checksum_length );
  const auto crc  = crc16_xmodem( body );

  if( data[ data.size() - 2 ] != static_cast< std::byte >( crc & 0xff )
      || data[ data.size() - 1 ] != static_cast< std::byte >( crc >> byte_bits ) )
    return std::unexpected( encode_errc::checksum_mismatch );

  return std::vector< std::byte >( body.begin() + 1, body.end() );
}

} // namespace lumen::encode
