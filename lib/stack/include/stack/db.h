#pragma once

#include "scene.h"

#include <SQLiteCpp/SQLiteCpp.h>
#include <filesystem>
#include <optional>
#include <string>
#include <utils/noCopying.h>
#include <vector>

namespace fs = std::filesystem;

namespace stack {
enum class Stage {
    direction_filter,
    reference_election,
    projection,
    overlap_clip,
    box_clip,
    shape_clip
};

enum class Disposition {
    kept,
    discarded,
    reprojected,
    elected
};

struct LedgerEntry {
    std::string scene;
    std::optional<std::string> date;
    Stage stage;
    std::optional<f64> statistic;
    Disposition disposition;
};

// Scene ledger: one row per decision taken about a scene during a run
class DataBase {
    MAKE_NONCOPYABLE(DataBase);

public:
    explicit DataBase(fs::path path);

    void record(Scene const& scene, Stage stage, std::optional<f64> statistic, Disposition disposition);
    std::vector<LedgerEntry> entries();
    int count(Disposition disposition);

    fs::path const& path() const { return m_path; }

private:
    fs::path m_path;
    SQLite::Database db;

    void create_table();
};
}
