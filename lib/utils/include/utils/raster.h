#pragma once

#include "utils/types.h"

#include <filesystem>
#include <gdal.h>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace utils {
struct RasterInfo;

// Subset of the gdal_translate options used on scene rasters
struct TranslateOptions {
    std::optional<GDALDataType> output_type;
    // Linear stretch of [first, second] onto the range of the output type
    std::optional<std::pair<f64, f64>> scale;
    std::optional<f64> resolution;
    std::optional<std::string> resample_alg;
    std::optional<Extent> projection_window;
    std::string format = "GTiff";
};

// Subset of the gdalwarp options used on scene rasters
struct WarpOptions {
    std::optional<std::string> dst_srs;
    std::optional<f64> resolution;
    std::optional<fs::path> cutline;
    bool crop_to_cutline = false;
    std::string format = "GTiff";
};

/**
 * Runs gdal_translate on a raster.
 * @returns: The destination path, or nothing if GDAL could not produce the raster
 * (for example a projection window entirely outside the source footprint).
 */
std::optional<fs::path> translate(fs::path const& source, fs::path const& destination, TranslateOptions const& options);

/**
 * Runs gdalwarp on a single raster.
 * @returns: The destination path, or nothing if GDAL could not produce the raster
 */
std::optional<fs::path> warp(fs::path const& source, fs::path const& destination, WarpOptions const& options);

/**
 * Burns the polygons of a single layer vector file onto the grid of a raster.
 * Vectors in another SRS are reprojected onto the grid.
 * @returns: 1 for pixels whose centre lies inside a polygon, 0 elsewhere
 */
RasterX<u8> rasterize(fs::path const& vector_file, RasterInfo const& grid);

// Replaces the extension of `path` by `suffix`, e.g. a.tif + "_dB.tif" -> a_dB.tif
fs::path derived_path(fs::path const& path, std::string const& suffix);
}
