#pragma once

#include <SQLiteCpp/SQLiteCpp.h>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <fmt/ostream.h>
#include <optional>
#include <string>
#include <string_view>

namespace date_time = boost::gregorian;

namespace utils {
struct Date {
    int year = 0;
    int month = 0;
    int day = 0;

    explicit Date(date_time::date const& date);
    Date() = default;

    // Accepts YYYY-MM-DD and YYYYMMDD, optionally followed by a THHMMSS time of day
    static std::optional<Date> parse(std::string_view text);

    bool operator==(Date const& other) const;
    bool operator<(Date const& other) const;
    friend std::ostream& operator<<(std::ostream& os, Date const& d);

    int bind_sql(SQLite::Statement& stmt, int start_index) const;
};
}

template<>
struct fmt::formatter<utils::Date> : ostream_formatter { };
