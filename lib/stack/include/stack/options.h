#pragma once

#include "cutter.h"
#include "scene.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace stack {
// Rasters retained in the product directory
enum class OutputType {
    dB,
    sigma_byte,
    dB_byte,
    amp,
    power
};

// Standard filters and resamples the full scenes, then clips. Quick clips
// first and processes the smaller rasters: faster, but the speckle filter and
// the averaging kernel see different pixels along the footprint edges, so the
// two modes do not produce identical values there.
enum class Mode {
    standard,
    quick
};

struct Options {
    // Explicit inputs; when empty the scenes are discovered in `source_dir`
    std::vector<fs::path> input_files;
    std::optional<fs::path> source_dir;
    bool from_archives = false;
    // Subscription to download the archives from
    std::optional<std::string> subscription;

    std::optional<std::string> output_name;
    OutputType output_type = OutputType::dB_byte;
    std::pair<f64, f64> db_range { -40.0, 0.0 };

    ClipSpec clip = NoClip {};
    f64 threshold = DEFAULT_COVERAGE_THRESHOLD;

    std::optional<f64> resolution;
    bool speckle_filter = false;
    bool amplitude_input = false;
    Mode mode = Mode::standard;
    std::optional<FlightDirection> keep;

    bool leave_intermediates = false;
    int font_size = 24;
    bool verbose = false;

    // Where the working and product directories are created
    fs::path base_dir = fs::current_path();

    [[nodiscard]] bool discovers_scenes() const { return input_files.empty(); }
    [[nodiscard]] fs::path working_dir() const { return base_dir / "TEMP"; }
    [[nodiscard]] fs::path log_file() const;
    [[nodiscard]] fs::path product_dir() const;
    [[nodiscard]] std::string animation_name() const;
};

// Accepts the command line spelling ("dB-byte", "sigma-byte", ...)
std::optional<OutputType> output_type_from_str(std::string_view str);
std::string output_type_name(OutputType type);

// "a" or "d"
std::optional<FlightDirection> keep_from_str(std::string_view str);

/**
 * Parses the command line.
 * Throws utils::ConfigurationConflict for more than one clip strategy, an
 * unknown output type or keep value, or otherwise malformed options.
 * @returns: Nothing when only the usage was requested
 */
std::optional<Options> parse_command_line(int argc, char const* const* argv);
std::string usage();

// Run statistics file for the -o/--outfile name on a command line that may not
// parse, so errors found while parsing can still be logged
fs::path log_file_from_arguments(int argc, char const* const* argv);

// Checks that every file and directory named by the options exists (utils::MissingInput)
void validate(Options const& options);
}
