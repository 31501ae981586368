#pragma once

#include <array>
#include <cstddef>
#include <span>

#include <lumen/crypto/error.hpp>

namespace lumen::crypto {

constexpr std::size_t public_key_length = 32;
constexpr std::size_t signature_length  = 64;

using public_key_data = std::array< std::byte, public_key_length >;
using signature       = std::array< std::byte, signature_length >;

/**
 * An Ed25519 verifying key.
 */
class public_key
{
public:
  public_key() = delete;
  explicit public_key( const public_key_data& bytes ) noexcept;
  public_key( const public_key& pk ) noexcept = default;
  public_key( public_key&& pk ) noexcept      = default;
  ~public_key() noexcept                      = default;

  public_key& operator=( const public_key& pk ) noexcept = default;
  public_key& operator=( public_key&& pk ) noexcept      = default;

  bool operator==( const public_key& rhs ) const noexcept;
  bool operator!=( const public_key& rhs ) const noexcept;

  /**
   * Construct from untrusted bytes, failing with crypto_errc::invalid_length
   * unless exactly public_key_length bytes are given.
   */
  static result< public_key > from_bytes( std::span< const std::byte > bytes ) noexcept;

  /**
   * A signature of any length other than signature_length does not verify.
   */
  bool verify( std::span< const std::byte > sig, std::span< const std::byte > message ) const noexcept;
  const public_key_data& bytes() const noexcept;

private:
  public_key_data _bytes;
};

} // namespace lumen::crypto
