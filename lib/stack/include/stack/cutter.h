#pragma once

#include "run_log.h"
#include "scene.h"

#include <optional>

namespace stack {
constexpr f64 DEFAULT_COVERAGE_THRESHOLD = 0.4;
// Any overlap at all counts when looking for the reference scene
constexpr f64 ELECTION_THRESHOLD = 0.01;

struct ClipResult {
    // Nothing when GDAL produced no raster (window or polygon outside the footprint)
    std::optional<fs::path> path;
    f64 fraction = 0.0;
};

// Fraction of non-zero pixels of a raster
f64 coverage_fraction(fs::path const& raster);

// Clips `source` to a map window (upper left / lower right corners)
ClipResult clip_to_box(fs::path const& source, utils::Extent const& box, fs::path const& destination);

// Clips `source` to the polygons of a shape file, cropping to their extent.
// The fraction counts only pixels inside the polygons.
ClipResult clip_to_shape(fs::path const& source, fs::path const& shape_file, fs::path const& destination);

// Footprint shared by every scene of the stack
utils::Extent common_overlap(StackState const& state);

/**
 * Moves the scene with the largest coverage of `box` to the front of the
 * stack, so that projections are reconciled against it.
 * Throws utils::NoOverlap when no scene overlaps the box at all.
 */
StackState elect_reference(StackState const& state, BoundingBox const& box, RunLog& log);

/**
 * Clips every scene to the footprint selected by `clip`:
 *  - Overlap: the intersection of all footprints (scenes must be pixel aligned)
 *  - BoundingBox: the box; scenes covering less than `threshold` are discarded
 *  - ShapeFile: the polygons, with the same threshold rule
 *  - NoClip: the stack is returned unchanged
 * Projections are reconciled before clipping. The result keeps the order of
 * the input and may be empty.
 */
StackState cut_stack(StackState const& state, ClipSpec const& clip, f64 threshold, RunLog& log);

// Why an empty cut result happened, one line per message
std::vector<std::string> no_overlap_diagnostic(ClipSpec const& clip);

// Throws utils::NoOverlap, after logging the diagnostic, if the cut left nothing
void require_survivors(StackState const& state, ClipSpec const& clip, RunLog& log);
}
