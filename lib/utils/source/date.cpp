#include "utils/date.h"

#include <iomanip>

namespace utils {
Date::Date(date_time::date const& date)
    : year(date.year())
    , month(date.month())
    , day(date.day())
{
}

std::optional<Date> Date::parse(std::string_view text)
{
    std::string day_part;
    if (text.size() >= 10 && text[4] == '-' && text[7] == '-') {
        day_part = std::string(text.substr(0, 10));
    } else if (text.size() >= 8) {
        day_part = std::string(text.substr(0, 8));
        if (text.size() > 8 && text[8] != 'T') {
            return {};
        }
    } else {
        return {};
    }

    try {
        auto date = day_part.find('-') == std::string::npos
            ? date_time::from_undelimited_string(day_part)
            : date_time::from_simple_string(day_part);
        if (date.is_special()) {
            return {};
        }
        return Date(date);
    } catch (std::exception const&) {
        // boost reports malformed dates (bad month, day out of range, ...) by throwing
        return {};
    }
}

bool Date::operator==(Date const& other) const
{
    return year == other.year && month == other.month && day == other.day;
}

bool Date::operator<(Date const& other) const
{
    date_time::date current(year, month, day);
    date_time::date compare(other.year, other.month, other.day);

    return current < compare;
}

std::ostream& operator<<(std::ostream& os, Date const& d)
{
    return os << d.year << '-' << std::setw(2) << std::setfill('0') << d.month << '-' << std::setw(2) << std::setfill('0') << d.day;
}

int Date::bind_sql(SQLite::Statement& stmt, int start_index) const
{
    stmt.bind(start_index, year);
    stmt.bind(start_index + 1, month);
    stmt.bind(start_index + 2, day);

    // Where you need to start binding things that come after this
    return start_index + 3;
}
}
