#pragma once

#include "external.h"
#include "run_log.h"
#include "scene.h"

#include <optional>
#include <vector>

namespace stack {
// Delay between animation frames, in 1/100 s
constexpr int FRAME_DELAY = 120;
constexpr int DEFAULT_FONT_SIZE = 24;

struct Frame {
    fs::path path;
    std::optional<AcquisitionDate> date;
};

// Sorts frames by acquisition date. Stable: frames of the same date keep
// their order, undated frames go last.
std::vector<Frame> order_frames(std::vector<Frame> frames);

// Encodes a single band byte raster as a PNG next to it
fs::path write_png_frame(fs::path const& byte_raster);

// Burns the frame date into the top of the image ("anno_<frame>")
Frame annotate(Frame const& frame, int font_size, ExternalTool& convert);

// Assembles the frames, in the given order, into a looping animation
fs::path animate(std::vector<Frame> const& frames, fs::path const& output, ExternalTool& convert);

struct ProductLayout {
    fs::path directory;
    fs::path animation;
};

/**
 * Publishes a run: the product directory is created fresh and receives the
 * animation, the retained rasters, the run log and the scene ledger. The run
 * log is closed first. A failure removes the partial product directory.
 */
void publish_product(ProductLayout const& layout, std::vector<fs::path> const& retained, RunLog& log);
}
