#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include <lumen/crypto/public_key.hpp>
#include <lumen/crypto/random.hpp>
#include <lumen/crypto/secret_key.hpp>
#include <lumen/identity/error.hpp>
#include <lumen/mnemonic/mnemonic.hpp>
#include <lumen/protocol/types.hpp>

namespace lumen::identity {

/**
 * keypair represents a network account: an Ed25519 verifying key and,
 * when constructed from secret material, the matching signing key.
 *
 * A keypair built from an address can verify but never sign. Operations that
 * need the signing key fail with identity_errc::no_secret_key instead.
 *
 * A keypair is immutable once constructed and may be shared between threads.
 */
class keypair
{
public:
  keypair() = delete;
  keypair( const keypair& ) = default;
  keypair( keypair&& ) noexcept = default;
  ~keypair() = default;

  keypair& operator=( const keypair& ) = default;
  keypair& operator=( keypair&& ) noexcept = default;

  /**
   * Derive a keypair from exactly 32 bytes of seed.
   */
  static result< keypair > from_raw_seed( std::span< const std::byte > seed ) noexcept;

  /**
   * Derive a keypair from 32 bytes of the process wide CSPRNG.
   */
  static result< keypair > random() noexcept;
  static result< keypair > random( crypto::random_source& source ) noexcept;

  /**
   * Derive the index-th keypair of a mnemonic phrase.
   */
  static result< keypair > from_mnemonic( std::string_view phrase,
                                          std::string_view passphrase = {},
                                          std::string_view language   = mnemonic::default_language,
                                          std::uint32_t index         = 0 ) noexcept;

  /**
   * Decode a strkey seed (S...).
   */
  static result< keypair > from_seed( std::string_view seed ) noexcept;

  /**
   * Decode a strkey address (G...). The result has no signing key.
   */
  static result< keypair > from_address( std::string_view address ) noexcept;

  static keypair from_public_key( const crypto::public_key& key ) noexcept;

  bool can_sign() const noexcept;

  const crypto::public_key& verifying_key() const noexcept;
  const crypto::public_key_data& raw_public_key() const noexcept;
  result< crypto::seed_data > raw_seed() const noexcept;

  std::string address() const noexcept;
  result< std::string > seed() const noexcept;

  result< crypto::signature > sign( std::span< const std::byte > data ) const noexcept;
  bool verify( std::span< const std::byte > data, std::span< const std::byte > signature ) const noexcept;

  /**
   * The last four bytes of the public key.
   *
   * Verifiers use the hint to pick candidate keys for a signature. It proves
   * nothing by itself, a match must still pass verify().
   */
  protocol::signature_hint signature_hint() const noexcept;
  result< protocol::decorated_signature > sign_decorated( std::span< const std::byte > data ) const noexcept;

  protocol::public_key_record public_key_record() const noexcept;

  /**
   * The base64 encoded XDR PublicKey.
   */
  std::string xdr() const noexcept;

private:
  struct public_only
  {
    crypto::public_key verifying_key;
  };

  struct full
  {
    crypto::secret_key signing_key;
    crypto::public_key verifying_key;
  };

  explicit keypair( public_only keys ) noexcept;
  explicit keypair( full keys ) noexcept;

  const crypto::secret_key* signing_key() const noexcept;

  std::variant< public_only, full > _keys;
};

} // namespace lumen::identity
