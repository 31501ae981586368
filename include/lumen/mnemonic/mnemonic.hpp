#pragma once

#include <cstdint>
#include <string_view>

#include <lumen/crypto/secret_key.hpp>
#include <lumen/mnemonic/error.hpp>

namespace lumen::mnemonic {

constexpr std::uint32_t pbkdf2_rounds       = 2'048;
constexpr std::string_view salt_prefix      = "mnemonic";
constexpr std::string_view default_language = "english";

bool supported_language( std::string_view language ) noexcept;

/**
 * Derive a 32 byte seed from a mnemonic phrase.
 *
 * The seed is the first half of PBKDF2-HMAC-SHA512 over the phrase, salted
 * with "mnemonic", the passphrase and the decimal index. Each index yields
 * an unrelated seed so a single phrase backs any number of keypairs.
 *
 * The phrase is used as given, it is not checked against the wordlist of
 * the language and must already be in NFKD form.
 */
result< crypto::seed_data > to_seed( std::string_view phrase,
                                     std::string_view passphrase = {},
                                     std::string_view language   = default_language,
                                     std::uint32_t index         = 0 ) noexcept;

} // namespace lumen::mnemonic
