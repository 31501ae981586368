#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <lumen/encode/error.hpp>

namespace lumen::encode {

std::string to_base64( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_base64( std::string_view sv ) noexcept;

} // namespace lumen::encode
