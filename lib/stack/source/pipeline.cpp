#include "stack/pipeline.h"

#include "stack/catalog.h"
#include "stack/compositor.h"
#include "stack/cutter.h"
#include "stack/radiometry.h"

#include <fmt/ranges.h>
#include <fmt/std.h>
#include <magic_enum.hpp>
#include <utils/error.h>
#include <utils/filesystem.h>
#include <utils/log.h>

namespace stack {
static auto logger = utils::create_logger("stack::pipeline");

namespace {
fs::path download_subscription(std::string const& subscription, fs::path const& base_dir, ExternalTool& downloader, RunLog& log)
{
    log.record("Using Hyp3 subscription named {} to download input files", subscription);
    fs::path destination = base_dir / "hyp3-products";
    fs::create_directories(destination);
    run_checked(downloader, { "--subscription", subscription, "--directory", destination.string() }, { destination });
    return destination;
}
}

StackState build_catalog(Options const& options, Toolbox& tools, RunLog& log)
{
    fs::path working_dir = options.working_dir();
    if (!options.discovers_scenes()) {
        return catalog_from_files(options.input_files, working_dir, log);
    }

    fs::path source = options.source_dir.value_or(options.base_dir);
    bool from_archives = options.from_archives;
    if (options.subscription.has_value()) {
        source = download_subscription(*options.subscription, options.base_dir, *tools.download, log);
        from_archives = true;
    }
    StackState state = discover_scenes(source, working_dir, from_archives, *tools.unzip, log);

    if (auto const* box = std::get_if<BoundingBox>(&options.clip); box != nullptr && !state.empty()) {
        state = elect_reference(state, *box, log);
    }
    return state;
}

StackState process_power(StackState const& state, Options const& options, Toolbox& tools, RunLog& log)
{
    auto radiometric = [&](StackState const& input) {
        StackState output = input;
        if (options.speckle_filter) {
            output = filter_stack(output, *tools.swap_bytes, *tools.speckle_filter, log);
        }
        if (options.resolution.has_value()) {
            output = change_resolution(output, *options.resolution, log);
        }
        return output;
    };

    StackState survivors;
    if (options.mode == Mode::quick) {
        survivors = cut_stack(state, options.clip, options.threshold, log);
        if (!survivors.empty()) {
            survivors = radiometric(survivors);
        }
    } else {
        survivors = cut_stack(radiometric(state), options.clip, options.threshold, log);
    }
    require_survivors(survivors, options.clip, log);
    return survivors;
}

std::vector<fs::path> retained_rasters(StageOutputs const& outputs, OutputType type)
{
    switch (type) {
    case OutputType::power:
        return outputs.power;
    case OutputType::dB:
        return outputs.decibel;
    case OutputType::dB_byte:
        return outputs.byte;
    case OutputType::amp:
        return outputs.power
            | ranges::views::transform([](fs::path const& raster) { return power_to_amplitude(raster); })
            | ranges::to<std::vector>();
    case OutputType::sigma_byte:
        return outputs.power
            | ranges::views::transform([](fs::path const& raster) { return sigma_byte(power_to_amplitude(raster)); })
            | ranges::to<std::vector>();
    }
    throw utils::GenericError(fmt::format("Unhandled output type {}", output_type_name(type)), *logger);
}

fs::path run(Options const& options, Toolbox& tools, RunLog& log)
{
    log.record("Creating {} output frames", output_type_name(options.output_type));
    if (options.keep.has_value()) {
        log.record("Keeping only {} images", magic_enum::enum_name(*options.keep));
    }
    validate(options);

    fs::path working_dir = options.working_dir();
    utils::create_clean_dir(working_dir);
    log.open_ledger(working_dir / "scenes.db");

    StackState state = build_catalog(options, tools, log);
    if (state.empty()) {
        throw utils::NoUsableScenes("Found no files to process.");
    }

    log.record("List of files to operate on");
    log.record("{}", paths(state) | ranges::views::transform([](fs::path const& p) { return p.filename().string(); }) | ranges::to<std::vector>());

    if (options.keep.has_value() && options.discovers_scenes()) {
        state = filter_by_direction(state, *options.keep, log);
        if (state.empty()) {
            throw utils::NoUsableScenes(fmt::format("No {} scenes left to process.", magic_enum::enum_name(*options.keep)));
        }
    }

    if (options.amplitude_input) {
        state = amplitude_to_power(state, log);
    }

    StackState survivors = process_power(state, options, tools, log);
    StageOutputs outputs;
    outputs.power = paths(survivors);

    log.record("Scaling to dB");
    for (auto const& raster : outputs.power) {
        outputs.decibel.push_back(power_to_decibel(raster));
    }

    auto [lower, upper] = options.db_range;
    log.record("Byte scaling from {} to {}", lower, upper);
    for (auto const& raster : outputs.decibel) {
        outputs.byte.push_back(byte_scale(raster, lower, upper));
    }

    // Dates come from the catalog, derived file names carry processing suffixes
    std::vector<Frame> frames;
    for (std::size_t i = 0; i < outputs.byte.size(); ++i) {
        frames.push_back(Frame { write_png_frame(outputs.byte[i]), survivors[i].acquisition_date });
    }
    frames = order_frames(std::move(frames));
    if (options.discovers_scenes()) {
        for (auto& frame : frames) {
            frame = annotate(frame, options.font_size, *tools.convert);
        }
    }
    fs::path animation = animate(frames, working_dir / options.animation_name(), *tools.convert);

    std::vector<fs::path> retained = retained_rasters(outputs, options.output_type);
    ProductLayout layout { options.product_dir(), animation };
    publish_product(layout, retained, log);

    if (!options.leave_intermediates) {
        fs::remove_all(working_dir);
    }
    logger->info("Done, product written to {}", layout.directory);
    return layout.directory;
}
}
