#include <lumen/crypto/kdf.hpp>
#include <lumen/memory/memory.hpp>
#include <lumen/mnemonic/mnemonic.hpp>

#include <algorithm>
#include <array>
#include <string>

#include <sodium.h>

namespace lumen::mnemonic {

constexpr std::array< std::string_view, 8 > languages{ "chinese_simplified",
                                                       "chinese_traditional",
                                                       "english",
                                                       "french",
                                                       "italian",
                                                       "japanese",
                                                       "korean",
                                                       "spanish" };

constexpr std::size_t pbkdf2_output_length = 64;

bool supported_language( std::string_view language ) noexcept
{
  return std::ranges::find( languages, language ) != languages.end();
}

result< crypto::seed_data > to_seed( std::string_view phrase,
                                     std::string_view passphrase,
                                     std::string_view language,
                                     std::uint32_t index ) noexcept
{
  if( phrase.empty() )
    return std::unexpected( mnemonic_errc::empty_phrase );

  if( !supported_language( language ) )
    return std::unexpected( mnemonic_errc::unsupported_language );

  std::string salt( salt_prefix );
  salt.append( passphrase );
  salt.append( std::to_string( index ) );

  auto derived = crypto::pbkdf2_hmac_sha512( memory::as_bytes( phrase ),
                                             memory::as_bytes( salt ),
                                             pbkdf2_rounds,
                                             pbkdf2_output_length );
  sodium_memzero( salt.data(), salt.size() );

  if( !derived )
    return std::unexpected( derived.error() );

  crypto::seed_data seed;
  std::copy_n( derived->begin(), seed.size(), seed.begin() );
  sodium_memzero( derived->data(), derived->size() );

  return seed;
}

} // namespace lumen::mnemonic
