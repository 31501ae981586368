#include <lumen/encode/base64.hpp>
#include <lumen/encode/strkey.hpp>
#include <lumen/identity/keypair.hpp>
#include <lumen/log/log.hpp>
#include <lumen/protocol/xdr.hpp>

#include <algorithm>
#include <utility>

#include <sodium.h>

namespace lumen::identity {

keypair::keypair( public_only keys ) noexcept:
    _keys( std::move( keys ) )
{}

keypair::keypair( full keys ) noexcept:
    _keys( std::move( keys ) )
{}

result< keypair > keypair::from_raw_seed( std::span< const std::byte > seed ) noexcept
{
  if( seed.size() != crypto::seed_length )
    return std::unexpected( identity_errc::invalid_seed_length );

  auto signing_key = crypto::secret_key::create( seed );
  if( !signing_key )
    return std::unexpected( signing_key.error() );

  auto verifying_key = signing_key->public_key();

  LOG_DEBUG( log::instance(),
             "Derived keypair for public key {}",
             log::hex{ verifying_key.bytes().data(), verifying_key.bytes().size() } );

  return keypair( full{ std::move( *signing_key ), verifying_key } );
}

result< keypair > keypair::random() noexcept
{
  return random( crypto::system_random() );
}

result< keypair > keypair::random( crypto::random_source& source ) noexcept
{
  crypto::seed_data seed;
  if( auto filled = source.fill( seed ); !filled )
    return std::unexpected( filled.error() );

  auto kp = from_raw_seed( seed );
  sodium_memzero( seed.data(), seed.size() );
  return kp;
}

result< keypair > keypair::from_mnemonic( std::string_view phrase,
                                          std::string_view passphrase,
                                          std::string_view language,
                                          std::uint32_t index ) noexcept
{
  auto seed = mnemonic::to_seed( phrase, passphrase, language, index );
  if( !seed )
    return std::unexpected( seed.error() );

  auto kp = from_raw_seed( *seed );
  sodium_memzero( seed->data(), seed->size() );
  return kp;
}

result< keypair > keypair::from_seed( std::string_view seed ) noexcept
{
  auto raw_seed = encode::decode_check( encode::version_byte::seed, seed );
  if( !raw_seed )
    return std::unexpected( raw_seed.error() );

  auto kp = from_raw_seed( *raw_seed );
  sodium_memzero( raw_seed->data(), raw_seed->size() );
  return kp;
}

result< keypair > keypair::from_address( std::string_view address ) noexcept
{
  auto raw_public_key = encode::decode_check( encode::version_byte::account, address );
  if( !raw_public_key )
    return std::unexpected( raw_public_key.error() );

  auto verifying_key = crypto::public_key::from_bytes( *raw_public_key );
  if( !verifying_key )
    return std::unexpected( identity_errc::invalid_address_length );

  return keypair( public_only{ *verifying_key } );
}

keypair keypair::from_public_key( const crypto::public_key& key ) noexcept
{
  return keypair( public_only{ key } );
}

bool keypair::can_sign() const noexcept
{
  return std::holds_alternative< full >( _keys );
}

const crypto::secret_key* keypair::signing_key() const noexcept
{
  if( const auto* keys = std::get_if< full >( &_keys ) )
    return &keys->signing_key;

  return nullptr;
}

const crypto::public_key& keypair::verifying_key() const noexcept
{
  return std::visit(
    []( const auto& keys ) -> const crypto::public_key&
    {
      return keys.verifying_key;
    },
    _keys );
}

const crypto::public_key_data& keypair::raw_public_key() const noexcept
{
  return verifying_key().bytes();
}

result< crypto::seed_data > keypair::raw_seed() const noexcept
{
  const auto* key = signing_key();
  if( !key )
    return std::unexpected( identity_errc::no_secret_key );

  return key->seed();
}

std::string keypair::address() const noexcept
{
  return encode::encode_check( encode::version_byte::account, raw_public_key() );
}

result< std::string > keypair::seed() const noexcept
{
  auto raw = raw_seed();
  if( !raw )
    return std::unexpected( raw.error() );

  auto encoded = encode::encode_check( encode::version_byte::seed, *raw );
  sodium_memzero( raw->data(), raw->size() );
  return encoded;
}

result< crypto::signature > keypair::sign( std::span< const std::byte > data ) const noexcept
{
  const auto* key = signing_key();
  if( !key )
    return std::unexpected( identity_errc::no_secret_key );

  return key->sign( data );
}

bool keypair::verify( std::span< const std::byte > data, std::span< const std::byte > signature ) const noexcept
{
  return verifying_key().verify( signature, data );
}

protocol::signature_hint keypair::signature_hint() const noexcept
{
  protocol::signature_hint hint;
  std::ranges::copy( std::span( raw_public_key() ).last< protocol::signature_hint_length >(), hint.begin() );
  return hint;
}

result< protocol::decorated_signature > keypair::sign_decorated( std::span< const std::byte > data ) const noexcept
{
  auto signature = sign( data );
  if( !signature )
    return std::unexpected( signature.error() );

  return protocol::decorated_signature{ .hint = signature_hint(), .signature = *signature };
}

protocol::public_key_record keypair::public_key_record() const noexcept
{
  return protocol::public_key_record{ .type = protocol::key_type::ed25519, .ed25519 = raw_public_key() };
}

std::string keypair::xdr() const noexcept
{
  return encode::to_base64( protocol::to_xdr( public_key_record() ) );
}

} // namespace lumen::identity
