#include "stack/naming.h"

#include <boost/algorithm/string/split.hpp>
#include <boost/regex.hpp>
#include <fstream>
#include <utils/error.h>
#include <utils/log.h>
#include <vector>

namespace stack {
static auto logger = utils::create_logger("stack::naming");

namespace {
std::vector<std::string> split(std::string_view text, char delimiter)
{
    std::vector<std::string> fields;
    boost::algorithm::split(fields, std::string(text), [delimiter](char c) { return c == delimiter; });
    return fields;
}
}

std::optional<AcquisitionDate> acquisition_date(std::string_view filename)
{
    auto fields = split(filename, '-');
    if (fields.size() < 5) {
        return {};
    }

    std::string const& field = fields[4];
    auto tokens = split(field, '_');
    std::size_t index = field.size() <= SHORT_DATE_FIELD_LENGTH ? 0 : 4;
    if (tokens.size() <= index) {
        return {};
    }

    std::string const& token = tokens[index];
    auto date = utils::Date::parse(token);
    if (!date.has_value()) {
        logger->debug("Token {} of {} is not a date", token, filename);
        return {};
    }
    return AcquisitionDate { token, *date };
}

std::optional<UtmZone> utm_zone(std::string_view projection)
{
    static boost::regex const expr { R"(UTM zone (\d+)([NS])?)" };

    boost::match_results<std::string_view::const_iterator> match;
    if (!boost::regex_search(projection.begin(), projection.end(), match, expr)) {
        return {};
    }
    UtmZone zone;
    zone.zone = std::stoi(match[1].str());
    if (match[2].matched) {
        zone.hemisphere = match[2].str().front();
    }
    return zone;
}

FlightDirection read_flight_direction(fs::path const& iso_xml)
{
    std::ifstream file(iso_xml);
    if (!file) {
        throw utils::IOError("Unable to read metadata file", iso_xml, *logger);
    }
    std::string line;
    while (std::getline(file, line)) {
        if (line.find("ascending") != std::string::npos) {
            return FlightDirection::ascending;
        }
        if (line.find("descending") != std::string::npos) {
            return FlightDirection::descending;
        }
    }
    return FlightDirection::unknown;
}
}
