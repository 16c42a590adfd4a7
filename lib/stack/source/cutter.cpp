#include "stack/cutter.h"
#include "stack/projection.h"

#include <cmath>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <utils/eigen.h>
#include <utils/error.h>
#include <utils/geotiff.h>
#include <utils/log.h>
#include <utils/raster.h>

namespace stack {
static auto logger = utils::create_logger("stack::cutter");

f64 coverage_fraction(fs::path const& raster)
{
    utils::GeoTIFF<f32> tiff(raster);
    return utils::percent_non_zero(tiff.values);
}

ClipResult clip_to_box(fs::path const& source, utils::Extent const& box, fs::path const& destination)
{
    utils::TranslateOptions options;
    options.projection_window = box;

    ClipResult result;
    result.path = utils::translate(source, destination, options);
    if (result.path.has_value()) {
        result.fraction = coverage_fraction(*result.path);
    }
    return result;
}

ClipResult clip_to_shape(fs::path const& source, fs::path const& shape_file, fs::path const& destination)
{
    utils::WarpOptions options;
    options.cutline = shape_file;
    options.crop_to_cutline = true;

    ClipResult result;
    result.path = utils::warp(source, destination, options);
    if (result.path.has_value() && fs::exists(*result.path)) {
        // Cropping keeps the polygon's bounding box, only pixels inside the
        // polygon count towards coverage
        utils::GeoTIFF<f32> clipped(*result.path);
        RasterX<u8> inside = utils::rasterize(shape_file, utils::read_info(*result.path));
        result.fraction = utils::percent_non_zero(clipped.values, inside);
    } else {
        result.path.reset();
    }
    return result;
}

utils::Extent common_overlap(StackState const& state)
{
    if (state.empty()) {
        return {};
    }
    auto first = utils::read_info(state.front().path);
    utils::Extent overlap = first.extent();
    for (auto const& scene : state) {
        auto info = utils::read_info(scene.path);
        if (std::abs(info.pixel_size() - first.pixel_size()) > 1e-9 * std::abs(first.pixel_size())) {
            logger->warn("{} has {}m pixels, {} has {}m. Overlap clipping assumes pixel aligned scenes",
                scene.name(), info.pixel_size(), state.front().name(), first.pixel_size());
        }
        overlap = overlap.intersect(info.extent());
    }
    return overlap;
}

StackState elect_reference(StackState const& state, BoundingBox const& box, RunLog& log)
{
    f64 max_fraction = 0.0;
    std::size_t best = 0;
    for (std::size_t i = 0; i < state.size(); ++i) {
        fs::path scratch = utils::derived_path(state[i].path, "_election.tif");
        auto clip = clip_to_box(state[i].path, box.area, scratch);
        if (clip.path.has_value()) {
            fs::remove(*clip.path);
        }
        logger->debug("{} covers {:.4f} of the area of interest", state[i].name(), clip.fraction);
        if (clip.fraction > max_fraction) {
            max_fraction = clip.fraction;
            best = i;
        }
    }

    if (max_fraction == 0.0) {
        log.error("None of the input scenes overlap with your area of interest!");
        throw utils::NoOverlap("None of the input scenes overlap with your area of interest");
    }
    if (max_fraction < ELECTION_THRESHOLD) {
        logger->warn("The best scene, {}, covers only {:.4f} of the area of interest", state[best].name(), max_fraction);
    }

    StackState result = state;
    // Make best overlap image the first in the list, so that projections are
    // reconciled against the scene that matches the bounding box best
    std::swap(result.front(), result[best]);
    log.disposition(result.front(), Stage::reference_election, max_fraction, Disposition::elected);
    return result;
}

namespace {
StackState cut_to_overlap(StackState const& state, RunLog& log)
{
    log.record("Cutting files to common overlap");
    StackState reconciled = reconcile_projections(state, log);
    utils::Extent overlap = common_overlap(reconciled);
    if (overlap.empty()) {
        logger->warn("Scenes share no footprint");
        return {};
    }
    logger->debug("Common overlap {}", overlap);

    StackState result;
    for (auto const& scene : reconciled) {
        auto clip = clip_to_box(scene.path, overlap, utils::derived_path(scene.path, "_overlap.tif"));
        if (!clip.path.has_value()) {
            throw utils::IOError("Unable to clip to the common overlap", scene.path, *logger);
        }
        log.disposition(scene, Stage::overlap_clip, clip.fraction, Disposition::kept);
        result.push_back(scene.with_path(*clip.path));
    }
    return result;
}

template<typename ClipFn>
StackState cut_with_threshold(StackState const& state, f64 threshold, Stage stage, ClipFn&& clip_fn, RunLog& log)
{
    log.record("Statistics for clipping:");
    log.record("file name : percent overlap : result");

    StackState result;
    for (auto const& scene : reconcile_projections(state, log)) {
        ClipResult clip = clip_fn(scene);
        bool keep = clip.path.has_value() && clip.fraction >= threshold;
        if (!keep) {
            if (clip.path.has_value()) {
                log.record("    Image fraction ({}) less than threshold of {} discarding", clip.fraction, threshold);
                fs::remove(*clip.path);
            }
        }
        log.disposition(scene, stage, clip.fraction, keep ? Disposition::kept : Disposition::discarded);
        if (keep) {
            result.push_back(scene.with_path(*clip.path));
        }
    }
    return result;
}
}

StackState cut_stack(StackState const& state, ClipSpec const& clip, f64 threshold, RunLog& log)
{
    auto cut_to_box = [&](BoundingBox const& box) {
        log.record("Clipping to bounding box {} {} {} {}", box.area.west, box.area.north, box.area.east, box.area.south);
        auto clip_fn = [&box](Scene const& scene) {
            return clip_to_box(scene.path, box.area, utils::derived_path(scene.path, "_clipped.tif"));
        };
        return cut_with_threshold(state, threshold, Stage::box_clip, clip_fn, log);
    };
    auto cut_to_shape = [&](ShapeFile const& shape) {
        log.record("Clipping to shape file {}", shape.path);
        auto clip_fn = [&shape](Scene const& scene) {
            return clip_to_shape(scene.path, shape.path, utils::derived_path(scene.path, "_shape.tif"));
        };
        return cut_with_threshold(state, threshold, Stage::shape_clip, clip_fn, log);
    };

    return std::visit(
        Visitor {
            [&](NoClip const&) { return state; },
            [&](Overlap const&) { return cut_to_overlap(state, log); },
            cut_to_box,
            cut_to_shape },
        clip);
}

std::vector<std::string> no_overlap_diagnostic(ClipSpec const& clip)
{
    return std::visit(
        Visitor {
            [](NoClip const&) { return std::vector<std::string> {}; },
            [](Overlap const&) { return std::vector<std::string> { "The image stack does not have overlap." }; },
            [](BoundingBox const&) {
                return std::vector<std::string> {
                    "None of the images have sufficient overlap with the area of interest.",
                    "You might try lowering the --black value or picking an new area of interest."
                };
            },
            [](ShapeFile const&) { return std::vector<std::string> { "The image stack does not overlap with the shape file." }; } },
        clip);
}

void require_survivors(StackState const& state, ClipSpec const& clip, RunLog& log)
{
    if (!state.empty()) {
        return;
    }
    log.error("No images survived the clipping process.");
    auto diagnostic = no_overlap_diagnostic(clip);
    for (auto const& line : diagnostic) {
        log.error("{}", line);
    }
    throw utils::NoOverlap(fmt::format("No images survived the clipping process ({}). {}", describe(clip), fmt::join(diagnostic, " ")));
}
}
