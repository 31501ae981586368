// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <lumen/encode/base64.hpp>
#include <lumen/encode/error.hpp>
#include <lumen/encode/hex.hpp>
#include <lumen/identity/keypair.hpp>
#include <lumen/memory.hpp>
#include <lumen/mnemonic.hpp>
#include <lumen/protocol/xdr.hpp>

using namespace std::string_view_literals;

namespace {

constexpr auto zero_address = "GA5WUJ54Z23KILLCUOUNAKTPBVZWKMQVO4O6EQ5GHLAERIMLLHNCSKYH"sv;
constexpr auto zero_seed    = "SAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAABSU2"sv;
constexpr auto phrase       = "illness spike retreat truth genius clock brain pass fit cave bargain toe"sv;

class sequence_random final: public lumen::crypto::random_source
{
public:
  lumen::crypto::result< void > fill( std::span< std::byte > buffer ) noexcept final
  {
    for( auto& b: buffer )
      b = std::byte{ next++ };
    return {};
  }

  std::uint8_t next = 0;
};

lumen::identity::keypair zero_keypair()
{
  lumen::crypto::seed_data seed{};
  return *lumen::identity::keypair::from_raw_seed( seed );
}

} // namespace

TEST( keypair, from_raw_seed )
{
  auto kp = zero_keypair();

  EXPECT_TRUE( kp.can_sign() );
  EXPECT_EQ( kp.address(), zero_address );
  EXPECT_EQ( *kp.seed(), zero_seed );
  EXPECT_TRUE( std::ranges::equal(
    kp.raw_public_key(),
    *lumen::encode::from_hex( "0x3b6a27bcceb6a42d62a3a8d02a6f0d73653215771de243a63ac048a18b59da29"sv ) ) );
  EXPECT_EQ( *kp.raw_seed(), lumen::crypto::seed_data{} );
  EXPECT_EQ( kp.verifying_key().bytes(), kp.raw_public_key() );
}

TEST( keypair, invalid_seed_length )
{
  for( std::size_t length: { 0, 16, 31, 33, 64 } )
  {
    std::vector< std::byte > seed( length );
    auto kp = lumen::identity::keypair::from_raw_seed( seed );
    ASSERT_FALSE( kp );
    EXPECT_EQ( kp.error(), lumen::identity::identity_errc::invalid_seed_length );
  }
}

TEST( keypair, seed_round_trip )
{
  auto kp = lumen::identity::keypair::from_seed( "SAAQCAIBAEAQCAIBAEAQCAIBAEAQCAIBAEAQCAIBAEAQCAIBAEAQC5MY"sv );
  ASSERT_TRUE( kp );
  EXPECT_TRUE( kp->can_sign() );
  EXPECT_EQ( kp->address(), "GCFIRY65OQE7DFP5KLNS2PF2LVZMUZYJX4OZIEQ36N2IQANUB5XVYOJR"sv );

  lumen::crypto::seed_data ones;
  ones.fill( std::byte{ 0x01 } );
  EXPECT_EQ( *kp->raw_seed(), ones );

  auto seed = kp->seed();
  ASSERT_TRUE( seed );
  auto kp2 = lumen::identity::keypair::from_seed( *seed );
  ASSERT_TRUE( kp2 );
  EXPECT_EQ( kp2->raw_public_key(), kp->raw_public_key() );
  EXPECT_EQ( *kp2->raw_seed(), *kp->raw_seed() );
}

TEST( keypair, address_round_trip )
{
  auto kp = lumen::identity::keypair::from_address( zero_address );
  ASSERT_TRUE( kp );
  EXPECT_FALSE( kp->can_sign() );
  EXPECT_EQ( kp->address(), zero_address );
  EXPECT_EQ( kp->raw_public_key(), zero_keypair().raw_public_key() );

  auto from_key = lumen::identity::keypair::from_public_key( zero_keypair().verifying_key() );
  EXPECT_FALSE( from_key.can_sign() );
  EXPECT_EQ( from_key.address(), zero_address );
}

TEST( keypair, no_secret_key )
{
  auto kp   = *lumen::identity::keypair::from_address( zero_address );
  auto data = lumen::memory::as_bytes( "hello world"sv );

  auto seed = kp.seed();
  ASSERT_FALSE( seed );
  EXPECT_EQ( seed.error(), lumen::identity::identity_errc::no_secret_key );

  auto raw_seed = kp.raw_seed();
  ASSERT_FALSE( raw_seed );
  EXPECT_EQ( raw_seed.error(), lumen::identity::identity_errc::no_secret_key );

  auto signature = kp.sign( data );
  ASSERT_FALSE( signature );
  EXPECT_EQ( signature.error(), lumen::identity::identity_errc::no_secret_key );

  auto decorated = kp.sign_decorated( data );
  ASSERT_FALSE( decorated );
  EXPECT_EQ( decorated.error(), lumen::identity::identity_errc::no_secret_key );

  // Verification needs only the public key
  EXPECT_TRUE( kp.verify( data, *zero_keypair().sign( data ) ) );
}

TEST( keypair, malformed_text )
{
  auto kp = lumen::identity::keypair::from_address( "GAAAAAAAAAAAAAAAAAAAAAAAAAAAGIQ="sv );
  ASSERT_FALSE( kp );
  EXPECT_EQ( kp.error(), lumen::identity::identity_errc::invalid_address_length );

  kp = lumen::identity::keypair::from_address( zero_seed );
  ASSERT_FALSE( kp );
  EXPECT_EQ( kp.error(), lumen::encode::encode_errc::invalid_version_byte );

  kp = lumen::identity::keypair::from_seed( zero_address );
  ASSERT_FALSE( kp );
  EXPECT_EQ( kp.error(), lumen::encode::encode_errc::invalid_version_byte );

  kp = lumen::identity::keypair::from_seed( "SAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAABSU3"sv );
  ASSERT_FALSE( kp );
  EXPECT_EQ( kp.error(), lumen::encode::encode_errc::checksum_mismatch );

  std::string padded( zero_address );
  padded.append( "========" );
  kp = lumen::identity::keypair::from_address( padded );
  ASSERT_FALSE( kp );
  EXPECT_EQ( kp.error(), lumen::encode::encode_errc::invalid_length );

  kp = lumen::identity::keypair::from_address( "not an address"sv );
  ASSERT_FALSE( kp );
  EXPECT_EQ( kp.error().category(), lumen::encode::encode_category() );
}

TEST( keypair, sign )
{
  auto kp   = zero_keypair();
  auto data = lumen::memory::as_bytes( "hello world"sv );

  auto signature = kp.sign( data );
  ASSERT_TRUE( signature );
  EXPECT_TRUE( std::ranges::equal(
    *signature,
    *lumen::encode::from_hex( "0xb0b47780f096ae60bfff8d8e7b19c36b321ae6e69cca972f2ff987ef30f20d29774b53bae404485c4391dd"
                              "f1b3f37aaa8a9747f984eb0884e8aa533386e73305"sv ) ) );

  EXPECT_TRUE( kp.verify( data, *signature ) );
  EXPECT_FALSE( kp.verify( lumen::memory::as_bytes( "hello world."sv ), *signature ) );

  for( std::size_t i = 0; i < signature->size(); ++i )
  {
    auto tampered = *signature;
    tampered[ i ] ^= std::byte{ 0x80 };
    EXPECT_FALSE( kp.verify( data, tampered ) );
  }

  std::vector< std::byte > payload( data.begin(), data.end() );
  for( std::size_t i = 0; i < payload.size(); ++i )
  {
    for( std::size_t bit = 0; bit < 8; ++bit )
    {
      auto tampered = payload;
      tampered[ i ] ^= std::byte( 1u << bit );
      EXPECT_FALSE( kp.verify( tampered, *signature ) );
    }
  }
  EXPECT_TRUE( kp.verify( payload, *signature ) );

  EXPECT_FALSE( kp.verify( data, std::span( *signature ).first( 32 ) ) );

  auto other = *lumen::identity::keypair::from_seed( "SAAQCAIBAEAQCAIBAEAQCAIBAEAQCAIBAEAQCAIBAEAQCAIBAEAQC5MY"sv );
  EXPECT_FALSE( other.verify( data, *signature ) );
}

TEST( keypair, sign_empty_message )
{
  auto kp = zero_keypair();

  auto signature = kp.sign( {} );
  ASSERT_TRUE( signature );
  EXPECT_TRUE( kp.verify( {}, *signature ) );
}

TEST( keypair, signature_hint )
{
  auto kp   = zero_keypair();
  auto hint = kp.signature_hint();

  EXPECT_TRUE( std::ranges::equal( hint, *lumen::encode::from_hex( "0x8b59da29"sv ) ) );
  EXPECT_TRUE( std::ranges::equal( hint, std::span( kp.raw_public_key() ).subspan( 28 ) ) );
}

TEST( keypair, sign_decorated )
{
  auto kp   = zero_keypair();
  auto data = lumen::memory::as_bytes( "hello world"sv );

  auto decorated = kp.sign_decorated( data );
  ASSERT_TRUE( decorated );
  EXPECT_EQ( decorated->hint, kp.signature_hint() );
  EXPECT_EQ( decorated->signature, *kp.sign( data ) );
  EXPECT_TRUE( kp.verify( data, decorated->signature ) );

  EXPECT_EQ( lumen::encode::to_base64( lumen::protocol::to_xdr( *decorated ) ),
             "i1naKQAAAECwtHeA8JauYL//jY57GcNrMhrm5pzKly8v+YfvMPINKXdLU7rkBEhcQ5Hd8bPzeqqKl0f5hOsIhOiqUzOG5zMF"sv );
}

TEST( keypair, xdr )
{
  auto kp = zero_keypair();

  auto record = kp.public_key_record();
  EXPECT_EQ( record.type, lumen::protocol::key_type::ed25519 );
  EXPECT_EQ( record.ed25519, kp.raw_public_key() );

  EXPECT_EQ( kp.xdr(), "AAAAADtqJ7zOtqQtYqOo0CpvDXNlMhV3HeJDpjrASKGLWdop"sv );

  auto decoded = lumen::encode::from_base64( kp.xdr() );
  ASSERT_TRUE( decoded );
  auto unpacked = lumen::protocol::from_xdr< lumen::protocol::public_key_record >( *decoded );
  ASSERT_TRUE( unpacked );
  EXPECT_EQ( *unpacked, record );
}

TEST( keypair, from_mnemonic )
{
  const std::array< std::string_view, 3 > addresses{ "GB5ZPFWNKIKNLHX2MP7RYIWJZXDVRODH7O5GTWL7NRGMJX5GGTFGLYE5"sv,
                                                     "GAY2EDNUVXNKTIE6WV3HL6XAMOAPZM54LAZVSP3FJJEKLY3OIRYKTDTX"sv,
                                                     "GAKGNCGSPCTMKZWVAAFPS6TLW7AKCU6FMJKTLCHCZOPCYIHOAIJ3T53V"sv };

  for( std::uint32_t index = 0; index < addresses.size(); ++index )
  {
    auto kp = lumen::identity::keypair::from_mnemonic( phrase, ""sv, "english"sv, index );
    ASSERT_TRUE( kp );
    EXPECT_TRUE( kp->can_sign() );
    EXPECT_EQ( kp->address(), addresses[ index ] );

    auto again = lumen::identity::keypair::from_mnemonic( phrase, ""sv, "english"sv, index );
    ASSERT_TRUE( again );
    EXPECT_EQ( *again->seed(), *kp->seed() );
  }

  auto kp = lumen::identity::keypair::from_mnemonic( phrase );
  ASSERT_TRUE( kp );
  EXPECT_TRUE( std::ranges::equal(
    *kp->raw_seed(),
    *lumen::encode::from_hex( "0xfdde379aefda737833efadca9542be31dd4ae6d09444e64e97ad05b41f21fb20"sv ) ) );

  auto bad = lumen::identity::keypair::from_mnemonic( ""sv );
  ASSERT_FALSE( bad );
  EXPECT_EQ( bad.error(), lumen::mnemonic::mnemonic_errc::empty_phrase );

  bad = lumen::identity::keypair::from_mnemonic( phrase, ""sv, "elvish"sv );
  ASSERT_FALSE( bad );
  EXPECT_EQ( bad.error(), lumen::mnemonic::mnemonic_errc::unsupported_language );
}

TEST( keypair, random )
{
  sequence_random source;
  auto kp = lumen::identity::keypair::random( source );
  ASSERT_TRUE( kp );
  EXPECT_EQ( kp->address(), "GAB2CB576PHBBPQ5ODORRZ2LYCMWPZGWGCN2KDK7DXOIMZASKUY3QZ6Q"sv );
  EXPECT_EQ( *kp->seed(), "SAAACAQDAQCQMBYIBEFAWDANBYHRAEISCMKBKFQXDAMRUGY4DUPB6NKI"sv );

  auto kp1 = lumen::identity::keypair::random();
  auto kp2 = lumen::identity::keypair::random();
  ASSERT_TRUE( kp1 );
  ASSERT_TRUE( kp2 );
  EXPECT_TRUE( kp1->can_sign() );
  EXPECT_NE( kp1->address(), kp2->address() );

  auto data = lumen::memory::as_bytes( "carpe diem"sv );
  EXPECT_TRUE( kp1->verify( data, *kp1->sign( data ) ) );
}

// NOLINTEND
