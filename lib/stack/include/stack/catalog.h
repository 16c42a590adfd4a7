#pragma once

#include "external.h"
#include "run_log.h"
#include "scene.h"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace stack {
// Builds a Scene for a raster: date from the file name, zone from its
// projection and flight direction from the sidecar of its product directory
Scene describe_scene(fs::path const& path, fs::path const& working_dir);

/**
 * Catalog built from explicitly named rasters. Each one is linked into the
 * working directory under its own file name so that derived rasters are
 * written next to it and the input stays untouched.
 * Throws utils::MissingInput if a file does not exist.
 */
StackState catalog_from_files(std::vector<fs::path> const& files, fs::path const& working_dir, RunLog& log);

/**
 * Catalog discovered in a download directory. Archives are extracted into the
 * working directory with `unzip`; otherwise RTC product directories are
 * linked into it. Scenes are the VV rasters of each product.
 */
StackState discover_scenes(fs::path const& source_dir, fs::path const& working_dir, bool from_archives, ExternalTool& unzip, RunLog& log);

// VV rasters of the products inside `working_dir`, or directly in it for
// archives that do not unpack into their own directory
std::vector<fs::path> find_scene_rasters(fs::path const& working_dir);

// Keeps the scenes flown in `keep` direction, order preserving
StackState filter_by_direction(StackState const& state, FlightDirection keep, RunLog& log);
}
