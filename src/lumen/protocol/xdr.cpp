#include <lumen/protocol/xdr.hpp>

#include <algorithm>
#include <cstring>
#include <utility>

#include <boost/endian/conversion.hpp>

namespace lumen::protocol {

namespace {

void pack_uint32( std::vector< std::byte >& out, std::uint32_t value ) noexcept
{
  value = boost::endian::native_to_big( value );
  const auto* first = reinterpret_cast< const std::byte* >( &value ); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
  out.insert( out.end(), first, first + sizeof( value ) );
}

void pack_opaque( std::vector< std::byte >& out, std::span< const std::byte > s ) noexcept
{
  out.insert( out.end(), s.begin(), s.end() );
}

struct reader
{
  std::span< const std::byte > data;

  result< std::uint32_t > uint32() noexcept
  {
    std::uint32_t value = 0;
    if( data.size() < sizeof( value ) )
      return std::unexpected( protocol_errc::unexpected_end_of_data );

    std::memcpy( &value, data.data(), sizeof( value ) );
    data = data.subspan( sizeof( value ) );
    return boost::endian::big_to_native( value );
  }

  template< std::size_t N >
  result< void > opaque( std::array< std::byte, N >& out ) noexcept
  {
    if( data.size() < N )
      return std::unexpected( protocol_errc::unexpected_end_of_data );

    std::ranges::copy( data.first( N ), out.begin() );
    data = data.subspan( N );
    return {};
  }

  result< void > finish() const noexcept
  {
    if( !data.empty() )
      return std::unexpected( protocol_errc::trailing_data );

    return {};
  }
};

} // namespace

std::vector< std::byte > to_xdr( const public_key_record& record ) noexcept
{
  std::vector< std::byte > out;
  out.reserve( sizeof( std::uint32_t ) + record.ed25519.size() );
  pack_uint32( out, static_cast< std::uint32_t >( std::to_underlying( record.type ) ) );
  pack_opaque( out, record.ed25519 );
  return out;
}

std::vector< std::byte > to_xdr( const decorated_signature& record ) noexcept
{
  std::vector< std::byte > out;
  out.reserve( record.hint.size() + sizeof( std::uint32_t ) + record.signature.size() );
  pack_opaque( out, record.hint );
  pack_uint32( out, static_cast< std::uint32_t >( record.signature.size() ) );
  pack_opaque( out, record.signature );
  return out;
}

template<>
result< public_key_record > from_xdr< public_key_record >( std::span< const std::byte > s ) noexcept
{
  reader r{ s };
  public_key_record record;

  auto type = r.uint32();
  if( !type )
    return std::unexpected( type.error() );

  if( *type != static_cast< std::uint32_t >( std::to_underlying( key_type::ed25519 ) ) )
    return std::unexpected( protocol_errc::unknown_key_type );

  record.type = key_type::ed25519;

  if( auto key = r.opaque( record.ed25519 ); !key )
    return std::unexpected( key.error() );

  if( auto end = r.finish(); !end )
    return std::unexpected( end.error() );

  return record;
}

template<>
result< decorated_signature > from_xdr< decorated_signature >( std::span< const std::byte > s ) noexcept
{
  reader r{ s };
  decorated_signature record;

  if( auto hint = r.opaque( record.hint ); !hint )
    return std::unexpected( hint.error() );

  auto length = r.uint32();
  if( !length )
    return std::unexpected( length.error() );

  if( *length != record.signature.size() )
    return std::unexpected( protocol_errc::invalid_signature_length );

  if( auto sig = r.opaque( record.signature ); !sig )
    return std::unexpected( sig.error() );

  if( auto end = r.finish(); !end )
    return std::unexpected( end.error() );

  return record;
}

} // namespace lumen::protocol
