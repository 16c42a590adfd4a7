#pragma once

#include "db.h"
#include "scene.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <utils/noCopying.h>

namespace fs = std::filesystem;

namespace stack {
/**
 * Append-only record of a stack run. Messages go to the console and to the
 * run statistics file; per-scene decisions are also stored in the scene ledger
 * once one is opened. The pipeline driver owns the log and passes it to every
 * stage by reference.
 */
class RunLog {
    MAKE_NONCOPYABLE(RunLog);

public:
    explicit RunLog(fs::path file, bool echo_to_console = true);
    ~RunLog();

    template<typename... Args>
    void record(fmt::format_string<Args...> message, Args&&... args)
    {
        write(fmt::format(message, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> message, Args&&... args)
    {
        write("ERROR: " + fmt::format(message, std::forward<Args>(args)...));
    }

    // Records "<scene> : <statistic> : <disposition>" and the matching ledger row
    void disposition(Scene const& scene, Stage stage, std::optional<f64> statistic, Disposition disposition);

    void open_ledger(fs::path const& path);
    DataBase* ledger() { return m_ledger.get(); }

    // Flushes and releases the log file and the ledger. Further records are dropped.
    void close();
    [[nodiscard]] bool closed() const { return m_logger == nullptr; }

    fs::path const& file() const { return m_file; }

private:
    void write(std::string const& message);

    fs::path m_file;
    std::shared_ptr<spdlog::logger> m_logger;
    std::unique_ptr<DataBase> m_ledger;
};
}
