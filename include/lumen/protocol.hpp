#pragma once

#include <lumen/protocol/error.hpp>
#include <lumen/protocol/types.hpp>
#include <lumen/protocol/xdr.hpp>
