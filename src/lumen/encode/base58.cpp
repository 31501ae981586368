#include <lumen/encode/base58.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>

namespace lumen::encode {

constexpr std::size_t base58_radix = 58;
constexpr std::uint32_t byte_bits  = 8;
constexpr std::uint32_t byte_mask  = 0xff;

constexpr std::string_view bitcoin_digits = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr std::string_view stellar_digits = "gsphnaf39wBUDNEGHJKLM4PQRST7VWXYZ2bcdeCr65jkm8oFqi1tuvAxyz";

using digit_table = std::array< std::int8_t, 256 >;

static constexpr digit_table make_digit_table( std::string_view digits ) noexcept
{
  digit_table table{};
  table.fill( -1 );
  for( std::size_t i = 0; i < digits.size(); ++i )
    table[ static_cast< unsigned char >( digits[ i ] ) ] = static_cast< std::int8_t >( i );
  return table;
}

constexpr auto bitcoin_table = make_digit_table( bitcoin_digits );
constexpr auto stellar_table = make_digit_table( stellar_digits );

static std::string_view digits_of( base58_alphabet alphabet ) noexcept
{
  return alphabet == base58_alphabet::stellar ? stellar_digits : bitcoin_digits;
}

static const digit_table& table_of( base58_alphabet alphabet ) noexcept
{
  return alphabet == base58_alphabet::stellar ? stellar_table : bitcoin_table;
}

std::string to_base58( std::span< const std::byte > s, base58_alphabet alphabet ) noexcept
{
  const auto digits = digits_of( alphabet );

  std::size_t zeroes = 0;
  while( zeroes < s.size() && s[ zeroes ] == std::byte{ 0x00 } )
    ++zeroes;

  // log(256) / log(58) ~= 1.37
  std::vector< std::uint8_t > b58( ( s.size() - zeroes ) * 138 / 100 + 1 );
  std::size_t length = 0;

  for( auto it = s.begin() + zeroes; it != s.end(); ++it )
  {
    std::uint32_t carry = std::to_integer< std::uint8_t >( *it );
    std::size_t i       = 0;
    for( auto digit = b58.rbegin(); ( carry || i < length ) && digit != b58.rend(); ++digit, ++i )
    {
      carry  += static_cast< std::uint32_t >( *digit ) << byte_bits;
      *digit  = static_cast< std::uint8_t >( carry % base58_radix );
      carry  /= base58_radix;
    }
    length = i;
  }

  auto digit = b58.begin() + static_cast< std::ptrdiff_t >( b58.size() - length );

  std::string encoded;
  encoded.reserve( zeroes + length );
  encoded.assign( zeroes, digits.front() );
  for( ; digit != b58.end(); ++digit )
    encoded.push_back( digits[ *digit ] );

  return encoded;
}

result< std::vector< std::byte > > from_base58( std::string_view sv, base58_alphabet alphabet ) noexcept
{
  const auto digits = digits_of( alphabet );
  const auto& table = table_of( alphabet );

  std::size_t zeroes = 0;
  while( zeroes < sv.size() && sv[ zeroes ] == digits.front() )
    ++zeroes;

  // log(58) / log(256) ~= 0.733
  std::vector< std::uint8_t > b256( ( sv.size() - zeroes ) * 733 / 1'000 + 1 );
  std::size_t length = 0;

  for( auto c: sv.substr( zeroes ) )
  {
    auto value = table[ static_cast< unsigned char >( c ) ];
    if( value < 0 )
      return std::unexpected( encode_errc::invalid_character );

    auto carry    = static_cast< std::uint32_t >( value );
    std::size_t i = 0;
    for( auto byte = b256.rbegin(); ( carry || i < length ) && byte != b256.rend(); ++byte, ++i )
    {
      carry  += static_cast< std::uint32_t >( *byte ) * base58_radix;
      *byte   = static_cast< std::uint8_t >( carry & byte_mask );
      carry >>= byte_bits;
    }
    length = i;
  }

  std::vector< std::byte > bytes( zeroes, std::byte{ 0x00 } );
  bytes.reserve( zeroes + length );
  std::ranges::transform( b256.begin() + static_cast< std::ptrdiff_t >( b256.size() - length ),
                          b256.end(),
                          std::back_inserter( bytes ),
                          []( std::uint8_t b )
                          {
                            return std::byte{ b };
                          } );

  return bytes;
}

} // namespace lumen::encode
