#pragma once

#include <lumen/crypto/error.hpp>
#include <lumen/crypto/hash.hpp>
#include <lumen/crypto/initialize.hpp>
#include <lumen/crypto/kdf.hpp>
#include <lumen/crypto/public_key.hpp>
#include <lumen/crypto/random.hpp>
#include <lumen/crypto/secret_key.hpp>
