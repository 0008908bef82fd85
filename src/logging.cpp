#include <oplog-cpp/logging.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace oplog_cpp {

auto set_log_level(std::string_view level) -> bool {
    auto parsed = spdlog::level::from_str(std::string{level});
    // from_str() maps unknown names to `off`.
    if (parsed == spdlog::level::off && level != "off") return false;
    spdlog::set_level(parsed);
    return true;
}

}  // namespace oplog_cpp
