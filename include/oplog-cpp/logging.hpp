/// @file logging.hpp
/// @brief Log level control for the library's spdlog output.

#pragma once

#include <string_view>

namespace oplog_cpp {

/// Set the level of the default spdlog logger by name.
///
/// Accepts "trace", "debug", "info", "warn", "error", "critical", "off".
/// @return false, leaving the level unchanged, for any other name.
auto set_log_level(std::string_view level) -> bool;

}  // namespace oplog_cpp
