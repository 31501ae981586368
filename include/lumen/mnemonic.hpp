#pragma once

#include <lumen/mnemonic/error.hpp>
#include <lumen/mnemonic/mnemonic.hpp>
