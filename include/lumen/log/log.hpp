#pragma once

#include <optional>
#include <string_view>

#include <quill/LogMacros.h>
#include <quill/core/LogLevel.h>

#include <lumen/log/formatter.hpp>
#include <lumen/log/frontend.hpp>

namespace lumen::log {

void initialize( quill::LogLevel level = quill::LogLevel::Info ) noexcept;
logger* instance() noexcept;

std::optional< quill::LogLevel > level_from_string( std::string_view level ) noexcept;

} // namespace lumen::log
