#pragma once

#include <array>
#include <span>

#include <lumen/crypto/error.hpp>
#include <lumen/crypto/public_key.hpp>
#include <lumen/crypto/random.hpp>

namespace lumen::crypto {

constexpr std::size_t seed_length       = 32;
constexpr std::size_t secret_key_length = 64;

using seed_data       = std::array< std::byte, seed_length >;
using secret_key_data = std::array< std::byte, secret_key_length >;

/**
 * An Ed25519 signing key derived from a 32 byte seed.
 *
 * The expanded secret is wiped when the key is destroyed.
 */
class secret_key
{
public:
  secret_key( secret_key&& sk ) noexcept      = default;
  secret_key( const secret_key& sk ) noexcept = default;
  ~secret_key() noexcept;

  secret_key& operator=( secret_key&& sk ) noexcept      = default;
  secret_key& operator=( const secret_key& sk ) noexcept = default;

  bool operator==( const secret_key& rhs ) const noexcept;
  bool operator!=( const secret_key& rhs ) const noexcept;

  static result< secret_key > create() noexcept;
  static result< secret_key > create( random_source& source ) noexcept;
  static result< secret_key > create( std::span< const std::byte > seed ) noexcept;

  result< signature > sign( std::span< const std::byte > message ) const noexcept;
  crypto::public_key public_key() const noexcept;
  seed_data seed() const noexcept;

private:
  secret_key() noexcept = default;

  public_key_data _public_bytes{};
  secret_key_data _secret_bytes{};
};

} // namespace lumen::crypto
