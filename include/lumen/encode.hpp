#pragma once

#include <lumen/encode/base32.hpp>
#include <lumen/encode/base58.hpp>
#include <lumen/encode/base58_check.hpp>
#include <lumen/encode/base64.hpp>
#include <lumen/encode/error.hpp>
#include <lumen/encode/hex.hpp>
#include <lumen/encode/strkey.hpp>
