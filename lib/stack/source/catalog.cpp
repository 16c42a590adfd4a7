#include "stack/catalog.h"
#include "stack/naming.h"

#include <fmt/ranges.h>
#include <fmt/std.h>
#include <magic_enum.hpp>
#include <utils/error.h>
#include <utils/filesystem.h>
#include <utils/geotiff.h>
#include <utils/log.h>

namespace stack {
static auto logger = utils::create_logger("stack::catalog");

namespace {
std::optional<fs::path> find_sidecar(fs::path const& raster, std::optional<AcquisitionDate> const& date, fs::path const& working_dir)
{
    static boost::regex const iso_expr { R"(.*\.iso\.xml)" };

    auto candidates = utils::find_matching(raster.parent_path(), iso_expr);
    if (!candidates.empty()) {
        return candidates.front();
    }

    // Rasters of older archives sit directly in the working directory; their
    // metadata is in the "<...date...>-rtc-gamma" directory of the same date
    if (!date.has_value()) {
        return {};
    }
    boost::regex const dir_expr { fmt::format(R"(.*{}.*-rtc-gamma)", date->token) };
    for (auto const& dir : utils::find_matching(working_dir, dir_expr)) {
        auto files = utils::find_matching(dir, iso_expr);
        if (!files.empty()) {
            return files.front();
        }
    }
    return {};
}

fs::path link_into(fs::path const& source, fs::path const& working_dir)
{
    fs::path link = working_dir / source.filename();
    if (fs::exists(fs::symlink_status(link))) {
        throw utils::ConfigurationConflict(fmt::format("Input {} appears more than once", source.filename().string()));
    }
    fs::create_symlink(source, link);
    return link;
}
}

Scene describe_scene(fs::path const& path, fs::path const& working_dir)
{
    Scene scene;
    scene.path = path;
    scene.acquisition_date = acquisition_date(path.filename().string());
    scene.projection_zone = utm_zone(utils::read_info(path).projection);

    if (auto sidecar = find_sidecar(path, scene.acquisition_date, working_dir)) {
        scene.flight_direction = read_flight_direction(*sidecar);
    }
    logger->debug("{}: date {}, direction {}", scene.name(),
        scene.acquisition_date ? scene.acquisition_date->token : "unknown", magic_enum::enum_name(scene.flight_direction));
    return scene;
}

StackState catalog_from_files(std::vector<fs::path> const& files, fs::path const& working_dir, RunLog& log)
{
    log.record("Infiles found; using them");
    StackState state;
    for (auto const& file : files) {
        if (!fs::is_regular_file(file)) {
            throw utils::MissingInput("Can't find input file", file);
        }
        fs::path staged = link_into(fs::absolute(file), working_dir);
        state.push_back(describe_scene(staged, working_dir));
    }
    return state;
}

StackState discover_scenes(fs::path const& source_dir, fs::path const& working_dir, bool from_archives, ExternalTool& unzip, RunLog& log)
{
    if (!fs::is_directory(source_dir)) {
        throw utils::MissingInput("Unable to find directory", source_dir);
    }
    fs::path source = fs::absolute(source_dir);

    std::vector<fs::path> entries;
    for (auto const& entry : fs::directory_iterator(source)) {
        entries.push_back(entry.path());
    }
    std::sort(entries.begin(), entries.end());

    if (from_archives) {
        log.record("No input files given, using hyp3 zip files from {}", source);
        for (auto const& entry : entries) {
            if (utils::find_directory_contents(entry) != utils::DirectoryContents::Archive) {
                continue;
            }
            log.record("    unzipping file {}", entry.filename());
            run_checked(unzip, { "-o", "-q", entry.string(), "-d", working_dir.string() }, {});
        }
    } else {
        log.record("No input files given, using already unzipped hyp3 files in {}", source);
        for (auto const& entry : entries) {
            if (utils::find_directory_contents(entry) == utils::DirectoryContents::RtcProduct) {
                link_into(entry, working_dir);
            }
        }
    }

    // Scenes are described where their sidecar lives, then linked to the top of
    // the working directory so that derived rasters never land in a source product
    return find_scene_rasters(working_dir)
        | ranges::views::transform([&working_dir](fs::path const& path) {
              Scene scene = describe_scene(path, working_dir);
              if (path.parent_path() != working_dir) {
                  scene.path = link_into(fs::canonical(path), working_dir);
              }
              return scene;
          })
        | ranges::to<std::vector>();
}

std::vector<fs::path> find_scene_rasters(fs::path const& working_dir)
{
    static boost::regex const raster_expr { R"(.*[vV][vV].*\.tif)" };

    std::vector<fs::path> rasters;
    for (auto const& entry : fs::directory_iterator(working_dir)) {
        if (fs::is_directory(entry)) {
            auto found = utils::find_matching(entry.path(), raster_expr);
            rasters.insert(rasters.end(), found.begin(), found.end());
        }
    }
    std::sort(rasters.begin(), rasters.end());

    if (rasters.empty()) {
        rasters = utils::find_matching(working_dir, raster_expr);
    }
    logger->debug("Found {} scene rasters in {}", rasters.size(), working_dir);
    return rasters;
}

StackState filter_by_direction(StackState const& state, FlightDirection keep, RunLog& log)
{
    StackState kept;
    for (auto const& scene : state) {
        log.record("Checking file {} for flight direction", scene.name());
        log.record("    Found direction {}", magic_enum::enum_name(scene.flight_direction));
        bool match = scene.flight_direction == keep;
        log.disposition(scene, Stage::direction_filter, {}, match ? Disposition::kept : Disposition::discarded);
        if (match) {
            kept.push_back(scene);
        }
    }
    return kept;
}
}
