#pragma once

#include <lumen/crypto/error.hpp>

namespace lumen::crypto {

/**
 * Initialize the underlying cryptographic library.
 *
 * Safe to call from any thread and any number of times, only the first call
 * performs the initialization.
 */
result< void > initialize() noexcept;

} // namespace lumen::crypto
