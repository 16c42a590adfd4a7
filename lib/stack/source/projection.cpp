#include "stack/projection.h"
#include "stack/naming.h"

#include <fmt/std.h>
#include <utils/error.h>
#include <utils/geotiff.h>
#include <utils/log.h>
#include <utils/raster.h>

namespace stack {
static auto logger = utils::create_logger("stack::projection");

StackState reconcile_projections(StackState const& state, RunLog& log)
{
    if (state.empty()) {
        return state;
    }

    auto reference = utils::read_info(state.front().path);
    auto reference_zone = utm_zone(reference.projection);
    if (!reference_zone.has_value()) {
        logger->info("Reference scene {} is not in a UTM projection, nothing to reconcile", state.front().name());
        return state;
    }
    f64 pixel_size = reference.pixel_size();
    logger->debug("Reference zone {}{} with {}m pixels", reference_zone->zone, reference_zone->hemisphere, pixel_size);

    StackState result;
    result.reserve(state.size());
    result.push_back(state.front());
    result.front().projection_zone = reference_zone;

    for (auto it = std::next(state.begin()); it != state.end(); ++it) {
        Scene const& scene = *it;
        auto zone = utm_zone(utils::read_info(scene.path).projection);
        if (!zone.has_value() || *zone == *reference_zone) {
            result.push_back(scene);
            continue;
        }

        if (zone->zone == reference_zone->zone) {
            logger->warn("{} is in zone {}{}, the reference is in zone {}{}", scene.name(),
                zone->zone, zone->hemisphere, reference_zone->zone, reference_zone->hemisphere);
            log.record("Hemispheres don't match... Reprojecting {}", scene.name());
        } else {
            log.record("Projections don't match... Reprojecting {}", scene.name());
        }
        utils::WarpOptions options;
        options.dst_srs = reference_zone->epsg();
        options.resolution = pixel_size;
        fs::path destination = utils::derived_path(scene.path, "_reproj.tif");
        auto warped = utils::warp(scene.path, destination, options);
        if (!warped.has_value()) {
            throw utils::IOError(fmt::format("Unable to reproject to {}", options.dst_srs.value()), scene.path, *logger);
        }

        Scene reprojected = scene.with_path(*warped);
        reprojected.projection_zone = UtmZone { reference_zone->zone, reference_zone->hemisphere };
        log.disposition(scene, Stage::projection, static_cast<f64>(zone->zone), Disposition::reprojected);
        result.push_back(reprojected);
    }
    return result;
}
}
