#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <hospes/error.hpp>

namespace hospes::encode {

// Lowercase, no prefix.
std::string to_hex( std::span< const std::byte > s );

// Accepts an optional 0x prefix and either case. Malformed input is an
// encoding fault naming the offending digit.
result< std::vector< std::byte > > from_hex( std::string_view sv );

} // namespace hospes::encode
