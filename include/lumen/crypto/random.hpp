#pragma once

#include <span>

#include <lumen/crypto/error.hpp>

namespace lumen::crypto {

/**
 * A source of cryptographically secure random bytes.
 *
 * Implementations must be safe to call concurrently.
 */
class random_source
{
public:
  random_source()                                  = default;
  random_source( const random_source& )            = delete;
  random_source( random_source&& )                 = delete;
  random_source& operator=( const random_source& ) = delete;
  random_source& operator=( random_source&& )      = delete;
  virtual ~random_source()                         = default;

  virtual result< void > fill( std::span< std::byte > buffer ) noexcept = 0;
};

/**
 * The process wide source backed by the operating system CSPRNG.
 */
random_source& system_random() noexcept;

} // namespace lumen::crypto
