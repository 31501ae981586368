#pragma once

#include <array>
#include <concepts>
#include <cstdint>

#include <boost/serialization/array.hpp>

#include <lumen/crypto/public_key.hpp>

namespace lumen::protocol {

constexpr std::size_t signature_hint_length = 4;

using signature_hint = std::array< std::byte, signature_hint_length >;

enum class key_type : std::int32_t
{
  ed25519 = 0
};

struct public_key_record
{
  key_type type = key_type::ed25519;
  crypto::public_key_data ed25519{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & type;
    ar & ed25519;
  }

  bool operator==( const public_key_record& ) const noexcept = default;
};

struct decorated_signature
{
  signature_hint hint{};
  crypto::signature signature{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & hint;
    ar & signature;
  }

  bool operator==( const decorated_signature& ) const noexcept = default;
};

} // namespace lumen::protocol

template< typename T >
concept WireRecord = std::same_as< lumen::protocol::public_key_record, T >
                     || std::same_as< lumen::protocol::decorated_signature, T >;
