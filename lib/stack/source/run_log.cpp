#include "stack/run_log.h"

#include <magic_enum.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <utils/log.h>

namespace stack {
static auto logger = utils::create_logger("stack::run_log");

RunLog::RunLog(fs::path file, bool echo_to_console)
    : m_file(std::move(file))
{
    std::vector<spdlog::sink_ptr> sinks;
    if (echo_to_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(m_file.string(), true));

    // Not registered: the run log is not a module logger and must not be
    // reachable through spdlog::get
    m_logger = std::make_shared<spdlog::logger>("run_log", sinks.begin(), sinks.end());
    m_logger->set_pattern("%v");
    m_logger->set_level(spdlog::level::info);
    m_logger->flush_on(spdlog::level::info);
}

RunLog::~RunLog()
{
    close();
}

void RunLog::write(std::string const& message)
{
    if (m_logger == nullptr) {
        logger->warn("Run log already closed, dropping: {}", message);
        return;
    }
    m_logger->info(message);
}

void RunLog::disposition(Scene const& scene, Stage stage, std::optional<f64> statistic, Disposition disposition)
{
    if (statistic.has_value()) {
        write(fmt::format("{} : {} : {}", scene.name(), *statistic, magic_enum::enum_name(disposition)));
    } else {
        write(fmt::format("{} : {}", scene.name(), magic_enum::enum_name(disposition)));
    }
    if (m_ledger != nullptr) {
        m_ledger->record(scene, stage, statistic, disposition);
    }
}

void RunLog::open_ledger(fs::path const& path)
{
    m_ledger = std::make_unique<DataBase>(path);
    logger->debug("Scene ledger opened at {}", path.string());
}

void RunLog::close()
{
    if (m_logger != nullptr) {
        m_logger->flush();
        m_logger.reset();
    }
    m_ledger.reset();
}
}
