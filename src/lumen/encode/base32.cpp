#include <lumen/encode/base32.hpp>

#include <array>
#include <cstdint>

namespace lumen::encode {

constexpr std::string_view base32_alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr char base32_padding              = '=';
constexpr std::size_t base32_block_length  = 8;
constexpr std::uint32_t base32_digit_bits  = 5;
constexpr std::uint32_t base32_digit_mask  = 0x1f;
constexpr std::uint32_t byte_bits          = 8;
constexpr std::uint32_t byte_mask          = 0xff;

static constexpr std::array< std::int8_t, 256 > make_base32_table() noexcept
{
  std::array< std::int8_t, 256 > table{};
  table.fill( -1 );
  for( std::size_t i = 0; i < base32_alphabet.size(); ++i )
    table[ static_cast< unsigned char >( base32_alphabet[ i ] ) ] = static_cast< std::int8_t >( i );
  return table;
}

constexpr auto base32_table = make_base32_table();

static constexpr std::size_t padding_of( std::size_t final_digits ) noexcept
{
  return final_digits ? base32_block_length - final_digits : 0;
}

std::string to_base32( std::span< const std::byte > s ) noexcept
{
  std::string encoded;
  encoded.reserve( ( s.size() + 4 ) / 5 * base32_block_length );

  std::uint32_t buffer = 0;
  std::uint32_t bits   = 0;

  for( const auto& b: s )
  {
    buffer  = buffer << byte_bits | std::to_integer< std::uint8_t >( b );
    bits   += byte_bits;

    while( bits >= base32_digit_bits )
    {
      encoded.push_back( base32_alphabet[ buffer >> ( bits - base32_digit_bits ) & base32_digit_mask ] );
      bits -= base32_digit_bits;
    }
  }

  if( bits )
    encoded.push_back( base32_alphabet[ buffer << ( base32_digit_bits - bits ) & base32_digit_mask ] );

  while( encoded.size() % base32_block_length )
    encoded.push_back( base32_padding );

  return encoded;
}

result< std::vector< std::byte > > from_base32( std::string_view sv ) noexcept
{
  const auto padded_length = sv.size();
  while( !sv.empty() && sv.back() == base32_padding )
    sv.remove_suffix( 1 );

  // Padding, when present, must exactly complete the final block
  const auto padding = padded_length - sv.size();
  if( padding && padding != padding_of( sv.size() % base32_block_length ) )
    return std::unexpected( encode_errc::invalid_length );

  // A final block of 1, 3 or 6 digits cannot come from whole bytes
  switch( sv.size() % base32_block_length )
  {
    case 1:
    case 3:
    case 6:
      return std::unexpected( encode_errc::invalid_length );
    default:
      break;
  }

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() * base32_digit_bits / byte_bits );

  std::uint32_t buffer = 0;
  std::uint32_t bits   = 0;

  for( char c: sv )
  {
    auto digit = base32_table[ static_cast< unsigned char >( c ) ];
    if( digit < 0 )
      return std::unexpected( encode_errc::invalid_character );

    buffer  = buffer << base32_digit_bits | static_cast< std::uint32_t >( digit );
    bits   += base32_digit_bits;

    if( bits >= byte_bits )
    {
      bytes.push_back( static_cast< std::byte >( buffer >> ( bits - byte_bits ) & byte_mask ) );
      bits -= byte_bits;
    }
  }

  if( buffer & ( ( 1u << bits ) - 1 ) )
    return std::unexpected( encode_errc::invalid_character );

  return bytes;
}

} // namespace lumen::encode
