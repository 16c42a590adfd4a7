#include "utils/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace utils {
namespace {
spdlog::level::level_enum& console_level()
{
    static spdlog::level::level_enum level = spdlog::level::warn;
    return level;
}
}

std::shared_ptr<spdlog::logger> create_logger(std::string const& name)
{
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(console_level());
    console_sink->set_pattern("[%^%l%$] [%n] %v");

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>((log_location() / fmt::format("{}.log", name)).string(), true);
    file_sink->set_level(spdlog::level::trace);

    std::vector<spdlog::sink_ptr> sinks { console_sink, file_sink };
    logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::info);
    logger->debug("Logger {} registered", name);

    return logger;
}

fs::path log_location()
{
    return fs::current_path() / "logs";
}

void set_console_level(spdlog::level::level_enum level)
{
    console_level() = level;
    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> const& logger) {
        // The first sink of every module logger is the console
        if (!logger->sinks().empty()) {
            logger->sinks().front()->set_level(level);
        }
    });
}
}
