#include "stack/db.h"

#include <magic_enum.hpp>
#include <sqlite3.h>
#include <utils/error.h>
#include <utils/log.h>

namespace stack {
static auto logger = utils::create_logger("stack::db");

DataBase::DataBase(fs::path path)
    : m_path(std::move(path))
    , db(m_path.string(), SQLite::OPEN_CREATE | SQLite::OPEN_READWRITE)
{
    create_table();
}

void DataBase::create_table()
{
    std::string sql = R"sql(
CREATE TABLE IF NOT EXISTS scenes(
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    scene TEXT NOT NULL,
    year INTEGER,
    month INTEGER,
    day INTEGER,
    date_token TEXT,
    stage TEXT NOT NULL,
    statistic REAL,
    disposition TEXT NOT NULL);
)sql";

    SQLite::Transaction transaction(db);
    db.exec(sql);
    transaction.commit();
}

void DataBase::record(Scene const& scene, Stage stage, std::optional<f64> statistic, Disposition disposition)
{
    std::string sql = R"sql(
INSERT INTO scenes (scene, year, month, day, date_token, stage, statistic, disposition)
VALUES(?, ?, ?, ?, ?, ?, ?, ?);
)sql";
    try {
        SQLite::Statement stmt(db, sql);
        stmt.bind(1, scene.name());
        int index = 2;
        if (scene.acquisition_date.has_value()) {
            index = scene.acquisition_date->date.bind_sql(stmt, index);
            stmt.bind(index, scene.acquisition_date->token);
        } else {
            stmt.bind(index);
            stmt.bind(index + 1);
            stmt.bind(index + 2);
            index += 3;
            stmt.bind(index);
        }
        stmt.bind(index + 1, std::string(magic_enum::enum_name(stage)));
        if (statistic.has_value()) {
            stmt.bind(index + 2, *statistic);
        } else {
            stmt.bind(index + 2);
        }
        stmt.bind(index + 3, std::string(magic_enum::enum_name(disposition)));
        stmt.exec();
    } catch (SQLite::Exception const& e) {
        throw utils::DBError(fmt::format("Unable to record {} for {}: {}", magic_enum::enum_name(stage), scene.name(), e.what()), e.getErrorCode(), *logger);
    }
}

namespace {
template<typename E>
E column_enum(SQLite::Column const& column)
{
    auto value = magic_enum::enum_cast<E>(column.getString());
    if (!value.has_value()) {
        throw utils::DBError(fmt::format("Unknown {} value '{}' in scene ledger", magic_enum::enum_type_name<E>(), column.getString()), SQLITE_MISMATCH, *logger);
    }
    return *value;
}
}

std::vector<LedgerEntry> DataBase::entries()
{
    std::vector<LedgerEntry> results;
    SQLite::Statement stmt(db, "SELECT scene, date_token, stage, statistic, disposition FROM scenes ORDER BY id");
    while (stmt.executeStep()) {
        LedgerEntry entry;
        entry.scene = stmt.getColumn(0).getString();
        if (!stmt.getColumn(1).isNull()) {
            entry.date = stmt.getColumn(1).getString();
        }
        entry.stage = column_enum<Stage>(stmt.getColumn(2));
        if (!stmt.getColumn(3).isNull()) {
            entry.statistic = stmt.getColumn(3).getDouble();
        }
        entry.disposition = column_enum<Disposition>(stmt.getColumn(4));
        results.push_back(entry);
    }
    return results;
}

int DataBase::count(Disposition disposition)
{
    SQLite::Statement stmt(db, "SELECT COUNT(*) FROM scenes WHERE disposition = ?");
    stmt.bind(1, std::string(magic_enum::enum_name(disposition)));
    stmt.executeStep();
    return stmt.getColumn(0).getInt();
}
}
