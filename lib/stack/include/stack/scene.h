#pragma once

#include <filesystem>
#include <optional>
#include <range/v3/all.hpp>
#include <string>
#include <utils/date.h>
#include <utils/types.h>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using namespace utils;

namespace stack {
enum class FlightDirection {
    ascending,
    descending,
    unknown
};

struct UtmZone {
    int zone = 0;
    char hemisphere = 'N';

    [[nodiscard]] bool north() const { return hemisphere != 'S'; }
    // EPSG:326zz for the northern hemisphere, EPSG:327zz for the southern one
    [[nodiscard]] std::string epsg() const;

    // 5N and 5S are different projections (false northing of 10,000 km)
    bool operator==(UtmZone const& other) const { return zone == other.zone && north() == other.north(); }
    bool operator!=(UtmZone const& other) const { return !(*this == other); }
};

// Date token taken from a scene file name. Only the token takes part in
// ordering; two scenes from the same day are not considered equal.
struct AcquisitionDate {
    std::string token;
    utils::Date date;

    bool operator<(AcquisitionDate const& other) const { return token < other.token; }
};

struct Scene {
    fs::path path;
    std::optional<AcquisitionDate> acquisition_date;
    FlightDirection flight_direction = FlightDirection::unknown;
    std::optional<UtmZone> projection_zone;

    // Same metadata, different raster
    [[nodiscard]] Scene with_path(fs::path new_path) const;
    [[nodiscard]] std::string name() const { return path.filename().string(); }
};

using StackState = std::vector<Scene>;

// Clip strategies
struct NoClip { };
struct Overlap { };
struct BoundingBox {
    // west = upper left easting, north = upper left northing,
    // east = lower right easting, south = lower right northing
    utils::Extent area;
};
struct ShapeFile {
    fs::path path;
};
using ClipSpec = std::variant<NoClip, Overlap, BoundingBox, ShapeFile>;

template<class... Ts>
struct Visitor : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Visitor(Ts...) -> Visitor<Ts...>;

std::string describe(ClipSpec const& clip);

// Applies `fn` to every raster of the stack, producing the next snapshot
template<typename Fn>
StackState map_paths(StackState const& state, Fn&& fn)
{
    return state
        | ranges::views::transform([&fn](Scene const& scene) { return scene.with_path(fn(scene.path)); })
        | ranges::to<std::vector>();
}

std::vector<fs::path> paths(StackState const& state);
}
