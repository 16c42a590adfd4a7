#include "stack/compositor.h"

#include <algorithm>
#include <fmt/std.h>
#include <opencv2/imgcodecs.hpp>
#include <utils/error.h>
#include <utils/filesystem.h>
#include <utils/geotiff.h>
#include <utils/log.h>

namespace stack {
static auto logger = utils::create_logger("stack::compositor");

namespace {
// rename(2) does not cross file systems. Links to user inputs are replaced by
// a copy of their target, the input itself is left untouched.
void move_file(fs::path const& source, fs::path const& destination)
{
    if (fs::is_symlink(source)) {
        fs::copy_file(fs::canonical(source), destination, fs::copy_options::overwrite_existing);
        fs::remove(source);
        return;
    }

    std::error_code ec;
    fs::rename(source, destination, ec);
    if (ec) {
        logger->debug("rename {} failed ({}), copying instead", source, ec.message());
        fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
        fs::remove(source);
    }
}
}

std::vector<Frame> order_frames(std::vector<Frame> frames)
{
    for (auto const& frame : frames) {
        if (!frame.date.has_value()) {
            logger->warn("No acquisition date for {}, it goes to the end of the animation", frame.path.filename());
        }
    }

    // Sort files based upon date and not upon file names
    std::stable_sort(frames.begin(), frames.end(), [](Frame const& a, Frame const& b) {
        if (a.date.has_value() != b.date.has_value()) {
            return a.date.has_value();
        }
        return a.date.has_value() && *a.date < *b.date;
    });
    return frames;
}

fs::path write_png_frame(fs::path const& byte_raster)
{
    utils::GeoTIFF<u8> tiff(byte_raster);
    cv::Mat image(tiff.height, tiff.width, CV_8UC1, tiff.values.data());

    fs::path output = byte_raster;
    output.replace_extension(".png");
    if (!cv::imwrite(output.string(), image)) {
        throw utils::IOError("Failed to write animation frame", output, *logger);
    }
    return output;
}

Frame annotate(Frame const& frame, int font_size, ExternalTool& convert)
{
    std::string caption = frame.date.has_value() ? frame.date->token : "";
    fs::path output = frame.path.parent_path() / ("anno_" + frame.path.filename().string());

    // A dark outline under white text keeps the date readable on any backscatter
    run_checked(convert,
        { frame.path.string(),
            "-pointsize", std::to_string(font_size),
            "-gravity", "north",
            "-stroke", "#000C", "-strokewidth", "2", "-annotate", "+0+5", caption,
            "-stroke", "none", "-fill", "white", "-annotate", "+0+5", caption,
            output.string() },
        { output });
    fs::remove(frame.path);
    return Frame { output, frame.date };
}

fs::path animate(std::vector<Frame> const& frames, fs::path const& output, ExternalTool& convert)
{
    std::vector<std::string> args { "-delay", std::to_string(FRAME_DELAY), "-loop", "0" };
    for (auto const& frame : frames) {
        args.push_back(frame.path.string());
    }
    args.push_back(output.string());
    run_checked(convert, args, { output });
    logger->info("Animation of {} frames written to {}", frames.size(), output);
    return output;
}

void publish_product(ProductLayout const& layout, std::vector<fs::path> const& retained, RunLog& log)
{
    std::optional<fs::path> ledger;
    if (log.ledger() != nullptr) {
        ledger = log.ledger()->path();
    }
    fs::path log_file = log.file();
    log.record("Publishing {} rasters to {}", retained.size(), layout.directory);
    log.close();

    utils::create_clean_dir(layout.directory);
    try {
        move_file(log_file, layout.directory / log_file.filename());
        if (ledger.has_value()) {
            move_file(*ledger, layout.directory / ledger->filename());
        }
        move_file(layout.animation, layout.directory / layout.animation.filename());
        for (auto const& raster : retained) {
            move_file(raster, layout.directory / raster.filename());
        }
    } catch (fs::filesystem_error const& e) {
        logger->error("Publishing the product failed: {}", e.what());
        fs::remove_all(layout.directory);
        throw utils::IOError(fmt::format("Unable to publish the product: {}", e.what()), layout.directory, *logger);
    }
}
}
