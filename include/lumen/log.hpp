#pragma once

#include <lumen/log/log.hpp>
