#pragma once

#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>
#include <string_view>

namespace fs = std::filesystem;

namespace utils {
// Named module logger: console output at the configured console level,
// everything down to trace in logs/<name>.log
std::shared_ptr<spdlog::logger> create_logger(std::string const& name);
fs::path log_location();

// Applies to every registered module logger and to loggers created afterwards
void set_console_level(spdlog::level::level_enum level);
}
