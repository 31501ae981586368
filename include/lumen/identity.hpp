#pragma once

#include <lumen/identity/error.hpp>
#include <lumen/identity/keypair.hpp>
#include <lumen/identity/legacy.hpp>
