#pragma once

#include "scene.h"

#include <optional>
#include <string_view>

namespace stack {
/**
 * Extracts the acquisition date token from a scene file name.
 *
 * File names are hyphen delimited and the fifth field (index 4) carries an
 * underscore delimited token sequence. Two naming schemes exist for the same
 * product family:
 *  - short field (<= 26 characters), e.g. "20170512_..._VV": the date is the first token
 *  - long field, the full granule name "S1B_IW_GRDH_1SDV_20180118T031947_...":
 *    the date is the fifth token
 * @returns: The token, or nothing when the name follows neither scheme or the
 * selected token does not start with a calendar date
 */
std::optional<AcquisitionDate> acquisition_date(std::string_view filename);

constexpr std::size_t SHORT_DATE_FIELD_LENGTH = 26;

// Zone and hemisphere of a "UTM zone <n><N|S>" projection, nothing for other projections
std::optional<UtmZone> utm_zone(std::string_view projection);

// Reads the flight direction from an ISO metadata sidecar: the first line
// mentioning "ascending" or "descending" decides
FlightDirection read_flight_direction(fs::path const& iso_xml);
}
