#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cstdint>
#include <fmt/format.h>

namespace utils {
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

// GDAL hands out pixels line by line, so rasters are stored row-major to keep
// RasterIO buffers and Eigen storage in the same order.
template<typename T>
using RasterX = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using GeoTransform = std::array<f64, 6>;

// Map coordinates of a north-up raster footprint
struct Extent {
    f64 west = 0.0;
    f64 north = 0.0;
    f64 east = 0.0;
    f64 south = 0.0;

    [[nodiscard]] bool empty() const { return west >= east || south >= north; }
    [[nodiscard]] Extent intersect(Extent const& other) const;
};

inline Extent Extent::intersect(Extent const& other) const
{
    return Extent {
        std::max(west, other.west),
        std::min(north, other.north),
        std::min(east, other.east),
        std::max(south, other.south)
    };
}
}

template<>
struct fmt::formatter<utils::Extent> : formatter<std::string_view> {
    template<typename FormatContext>
    auto format(utils::Extent const& e, FormatContext& ctx) const
    {
        return formatter<std::string_view>::format(
            fmt::format("({:.3f}, {:.3f}) - ({:.3f}, {:.3f})", e.west, e.north, e.east, e.south), ctx);
    }
};
