#pragma once

#include <string>

#include <quill/LogMacros.h>

#include <hospes/log/formatter.hpp>
#include <hospes/log/frontend.hpp>

namespace hospes::log {

void initialize() noexcept;
logger* instance() noexcept;

// Throws std::invalid_argument for an unrecognized level name.
void set_level( const std::string& level );

} // namespace hospes::log
