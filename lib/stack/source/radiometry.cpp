#include "stack/radiometry.h"

#include <algorithm>
#include <cmath>
#include <fmt/std.h>
#include <fstream>
#include <utils/eigen.h>
#include <utils/error.h>
#include <utils/geotiff.h>
#include <utils/log.h>
#include <utils/raster.h>

namespace stack {
static auto logger = utils::create_logger("stack::radiometry");

namespace {
// Reads a raster, applies `fn` to its pixels and writes the result with the
// same georeferencing
template<typename Fn>
fs::path transform_pixels(fs::path const& raster, std::string const& suffix, Fn&& fn)
{
    utils::GeoTIFF<f32> tiff(raster);
    tiff.values = tiff.values.unaryExpr(fn);
    fs::path output = utils::derived_path(raster, suffix);
    tiff.write(output);
    return output;
}

fs::path checked(std::optional<fs::path> const& result, fs::path const& source, std::string_view what)
{
    if (!result.has_value()) {
        throw utils::IOError(fmt::format("Unable to {}", what), source, *logger);
    }
    return *result;
}
}

fs::path amplitude_to_power(fs::path const& raster)
{
    return transform_pixels(raster, "_pwr.tif", [](f32 v) { return v * v; });
}

fs::path power_to_amplitude(fs::path const& raster)
{
    return transform_pixels(raster, "_amp.tif", [](f32 v) { return v > 0.0f ? std::sqrt(v) : 0.0f; });
}

fs::path power_to_decibel(fs::path const& raster)
{
    return transform_pixels(raster, "_dB.tif", [](f32 v) { return v > 0.0f ? 10.0f * std::log(v) : NO_DATA_DB; });
}

fs::path byte_scale(fs::path const& raster, f64 lower, f64 upper)
{
    utils::TranslateOptions options;
    options.output_type = GDT_Byte;
    options.scale = std::make_pair(lower, upper);
    fs::path output = utils::derived_path(raster, fmt::format("{}_{}.tif", static_cast<int>(lower), static_cast<int>(upper)));
    return checked(utils::translate(raster, output, options), raster, "byte scale");
}

fs::path change_resolution(fs::path const& raster, f64 resolution)
{
    utils::TranslateOptions options;
    options.resolution = resolution;
    options.resample_alg = "average";
    fs::path output = utils::derived_path(raster, fmt::format("_{}m.tif", static_cast<int>(resolution)));
    return checked(utils::translate(raster, output, options), raster, "change resolution");
}

fs::path speckle_filter(fs::path const& raster, ExternalTool& swap_bytes, ExternalTool& filter)
{
    utils::GeoTIFF<f32> tiff(raster);

    fs::path raw = utils::derived_path(raster, "_sf_raw.bin");
    fs::path swapped = utils::derived_path(raster, "_sf_swapped.bin");
    fs::path filtered = utils::derived_path(raster, "_sf_filtered.bin");
    fs::path restored = utils::derived_path(raster, "_sf_restored.bin");

    auto byte_count = static_cast<std::streamsize>(tiff.values.size() * sizeof(f32));
    {
        std::ofstream out(raw, std::ios::binary);
        out.write(reinterpret_cast<char const*>(tiff.values.data()), byte_count);
        if (!out) {
            throw utils::IOError("Unable to write raw samples for the speckle filter", raw, *logger);
        }
    }

    run_checked(swap_bytes, { raw.string(), swapped.string(), "4" }, { swapped });
    run_checked(filter, { swapped.string(), filtered.string(), std::to_string(tiff.width), "1", "4", "7", "7" }, { filtered });
    run_checked(swap_bytes, { filtered.string(), restored.string(), "4" }, { restored });

    if (static_cast<std::streamsize>(fs::file_size(restored)) != byte_count) {
        throw utils::IOError(fmt::format("Speckle filter output has {} bytes, expected {}", fs::file_size(restored), byte_count), restored, *logger);
    }
    {
        std::ifstream in(restored, std::ios::binary);
        in.read(reinterpret_cast<char*>(tiff.values.data()), byte_count);
        if (!in) {
            throw utils::IOError("Unable to read the speckle filter output", restored, *logger);
        }
    }

    for (auto const& scratch : { raw, swapped, filtered, restored }) {
        fs::remove(scratch);
    }

    fs::path output = utils::derived_path(raster, "_sf.tif");
    tiff.write(output);
    return output;
}

std::pair<f64, f64> two_sigma_cutoffs(RasterX<f32> const& values)
{
    if (values.size() == 0) {
        throw utils::GenericError("Cannot compute a stretch window for an empty raster", *logger);
    }
    std::vector<f64> samples(values.data(), values.data() + values.size());

    // 98th percentile, linear interpolation between the closest ranks
    std::vector<f64> sorted = samples;
    std::sort(sorted.begin(), sorted.end());
    f64 rank = 0.98 * static_cast<f64>(sorted.size() - 1);
    auto below = static_cast<std::size_t>(std::floor(rank));
    auto above = std::min(below + 1, sorted.size() - 1);
    f64 top = sorted[below] + (rank - static_cast<f64>(below)) * (sorted[above] - sorted[below]);

    Eigen::Map<Eigen::VectorXd> clipped(samples.data(), static_cast<Eigen::Index>(samples.size()));
    clipped = clipped.cwiseMin(top);
    f64 mean = clipped.mean();
    f64 stddev = std::sqrt((clipped.array() - mean).square().mean());

    logger->debug("Two sigma window around {:.4f} (sigma {:.4f}, 98th percentile {:.4f})", mean, stddev, top);
    return { mean - 2 * stddev, mean + 2 * stddev };
}

fs::path sigma_byte(fs::path const& amplitude_raster)
{
    utils::GeoTIFF<f32> tiff(amplitude_raster);
    auto window = two_sigma_cutoffs(tiff.values);

    utils::TranslateOptions options;
    options.output_type = GDT_Byte;
    options.scale = window;
    fs::path output = utils::derived_path(amplitude_raster, "_sigma.tif");
    return checked(utils::translate(amplitude_raster, output, options), amplitude_raster, "scale to the two sigma window");
}

StackState amplitude_to_power(StackState const& state, RunLog& log)
{
    log.record("Converting amplitude to power");
    return map_paths(state, [](fs::path const& path) { return amplitude_to_power(path); });
}

StackState filter_stack(StackState const& state, ExternalTool& swap_bytes, ExternalTool& filter, RunLog& log)
{
    log.record("Applying speckle filter");
    return map_paths(state, [&](fs::path const& path) { return speckle_filter(path, swap_bytes, filter); });
}

StackState change_resolution(StackState const& state, f64 resolution, RunLog& log)
{
    log.record("Changing resolution to {}", resolution);
    return map_paths(state, [resolution](fs::path const& path) { return change_resolution(path, resolution); });
}
}
