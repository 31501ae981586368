// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include <lumen/encode/hex.hpp>
#include <lumen/mnemonic/mnemonic.hpp>

using namespace std::string_view_literals;

namespace {

constexpr auto phrase = "illness spike retreat truth genius clock brain pass fit cave bargain toe"sv;

} // namespace

TEST( mnemonic, to_seed )
{
  auto seed = lumen::mnemonic::to_seed( phrase );
  ASSERT_TRUE( seed );
  EXPECT_TRUE( std::ranges::equal(
    *seed,
    *lumen::encode::from_hex( "0xfdde379aefda737833efadca9542be31dd4ae6d09444e64e97ad05b41f21fb20"sv ) ) );

  seed = lumen::mnemonic::to_seed( phrase, ""sv, "english"sv, 1 );
  ASSERT_TRUE( seed );
  EXPECT_TRUE( std::ranges::equal(
    *seed,
    *lumen::encode::from_hex( "0xf6d4a8fce0ad9c0092db902c3c4186ebcde659bb1515c93f0ddb0cc7138cd39d"sv ) ) );

  seed = lumen::mnemonic::to_seed( phrase, ""sv, "english"sv, 2 );
  ASSERT_TRUE( seed );
  EXPECT_TRUE( std::ranges::equal(
    *seed,
    *lumen::encode::from_hex( "0xbe7d37329d023981763c3999fc3074074dfd7f033464e6e580ef607acdeb0b64"sv ) ) );
}

TEST( mnemonic, passphrase )
{
  auto seed = lumen::mnemonic::to_seed( "hello world"sv, "pass"sv );
  ASSERT_TRUE( seed );
  EXPECT_TRUE( std::ranges::equal(
    *seed,
    *lumen::encode::from_hex( "0xc6eb8f5f3aa6f9ca71e370786a5566cd2c645346d68af40ec4b2d7974ae57f10"sv ) ) );

  auto without = lumen::mnemonic::to_seed( "hello world"sv );
  ASSERT_TRUE( without );
  EXPECT_NE( *seed, *without );
}

TEST( mnemonic, determinism )
{
  auto seed1 = lumen::mnemonic::to_seed( phrase, "secret"sv, "english"sv, 7 );
  auto seed2 = lumen::mnemonic::to_seed( phrase, "secret"sv, "english"sv, 7 );
  ASSERT_TRUE( seed1 );
  ASSERT_TRUE( seed2 );
  EXPECT_EQ( *seed1, *seed2 );

  // The language only gates the call, it is not part of the derivation
  auto seed3 = lumen::mnemonic::to_seed( phrase, "secret"sv, "spanish"sv, 7 );
  ASSERT_TRUE( seed3 );
  EXPECT_EQ( *seed1, *seed3 );
}

TEST( mnemonic, distinct_indices )
{
  std::vector< lumen::crypto::seed_data > seeds;
  for( std::uint32_t index = 0; index < 5; ++index )
  {
    auto seed = lumen::mnemonic::to_seed( phrase, ""sv, "english"sv, index );
    ASSERT_TRUE( seed );
    EXPECT_EQ( std::ranges::find( seeds, *seed ), seeds.end() );
    seeds.push_back( *seed );
  }
}

TEST( mnemonic, errors )
{
  auto seed = lumen::mnemonic::to_seed( ""sv );
  ASSERT_FALSE( seed );
  EXPECT_EQ( seed.error(), lumen::mnemonic::mnemonic_errc::empty_phrase );

  seed = lumen::mnemonic::to_seed( phrase, ""sv, "klingon"sv );
  ASSERT_FALSE( seed );
  EXPECT_EQ( seed.error(), lumen::mnemonic::mnemonic_errc::unsupported_language );

  seed = lumen::mnemonic::to_seed( phrase, ""sv, "English"sv );
  ASSERT_FALSE( seed );
  EXPECT_EQ( seed.error(), lumen::mnemonic::mnemonic_errc::unsupported_language );
}

TEST( mnemonic, supported_language )
{
  for( auto language: { "chinese_simplified"sv,
                        "chinese_traditional"sv,
                        "english"sv,
                        "french"sv,
                        "italian"sv,
                        "japanese"sv,
                        "korean"sv,
                        "spanish"sv } )
    EXPECT_TRUE( lumen::mnemonic::supported_language( language ) );

  EXPECT_FALSE( lumen::mnemonic::supported_language( ""sv ) );
  EXPECT_FALSE( lumen::mnemonic::supported_language( "german"sv ) );
}

// NOLINTEND
