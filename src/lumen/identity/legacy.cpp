#include <lumen/crypto/hash.hpp>
#include <lumen/encode/base58_check.hpp>
#include <lumen/encode/error.hpp>
#include <lumen/identity/legacy.hpp>
#include <lumen/log/log.hpp>

#include <mutex>
#include <span>
#include <utility>
#include <vector>

#include <sodium.h>

namespace lumen::identity::legacy {

namespace {

constexpr auto alphabet = encode::base58_alphabet::stellar;

std::mutex handler_mutex;
deprecation_handler installed_handler;

void notify( const deprecation_notice& notice ) noexcept
{
  deprecation_handler handler;

  {
    std::lock_guard lock( handler_mutex );
    handler = installed_handler;
  }

  if( handler )
    handler( notice );
  else
    LOG_WARNING( lumen::log::instance(),
                 "Base58 encoding is deprecated, {} is retained only for migration, use {} instead",
                 notice.operation,
                 notice.replacement );
}

} // namespace

void set_deprecation_handler( deprecation_handler handler )
{
  std::lock_guard lock( handler_mutex );
  installed_handler = std::move( handler );
}

result< keypair > from_seed( std::string_view seed ) noexcept
{
  notify( { .operation = "legacy::from_seed", .replacement = "keypair::from_seed" } );

  auto decoded = encode::from_base58_check( seed, alphabet );
  if( !decoded )
    return std::unexpected( decoded.error() );

  if( decoded->empty() )
    return std::unexpected( encode::encode_errc::invalid_length );

  if( decoded->front() != seed_version )
  {
    sodium_memzero( decoded->data(), decoded->size() );
    return std::unexpected( encode::encode_errc::invalid_version_byte );
  }

  auto kp = keypair::from_raw_seed( std::span< const std::byte >( *decoded ).subspan( 1 ) );
  sodium_memzero( decoded->data(), decoded->size() );
  return kp;
}

result< std::string > address( const keypair& kp ) noexcept
{
  notify( { .operation = "legacy::address", .replacement = "keypair::address" } );

  auto account_id = crypto::hash160( kp.raw_public_key() );
  if( !account_id )
    return std::unexpected( account_id.error() );

  LOG_DEBUG( lumen::log::instance(),
             "Derived legacy account id {}",
             log::base58{ account_id->data(), account_id->size() } );

  std::vector< std::byte > data;
  data.reserve( 1 + account_id->size() );
  data.push_back( address_version );
  data.insert( data.end(), account_id->begin(), account_id->end() );

  return encode::to_base58_check( data, alphabet );
}

result< std::string > seed( const keypair& kp ) noexcept
{
  notify( { .operation = "legacy::seed", .replacement = "keypair::seed" } );

  auto raw_seed = kp.raw_seed();
  if( !raw_seed )
    return std::unexpected( raw_seed.error() );

  std::vector< std::byte > data;
  data.reserve( 1 + raw_seed->size() );
  data.push_back( seed_version );
  data.insert( data.end(), raw_seed->begin(), raw_seed->end() );

  auto encoded = encode::to_base58_check( data, alphabet );
  sodium_memzero( data.data(), data.size() );
  sodium_memzero( raw_seed->data(), raw_seed->size() );
  return encoded;
}

} // namespace lumen::identity::legacy
