#pragma once

#include <lumen/memory/memory.hpp>
