#pragma once

#include "external.h"
#include "options.h"
#include "run_log.h"
#include "scene.h"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace stack {
// Rasters of every radiometric stage that survived the cut, in catalog order
struct StageOutputs {
    std::vector<fs::path> power;
    std::vector<fs::path> decibel;
    std::vector<fs::path> byte;
};

// Builds the scene catalog in the working directory, from the explicit input
// files or by discovering (and possibly downloading) RTC products
StackState build_catalog(Options const& options, Toolbox& tools, RunLog& log);

// Filtering, resampling and cutting in the order selected by the mode
StackState process_power(StackState const& state, Options const& options, Toolbox& tools, RunLog& log);

// The rasters published for the requested output type; may derive new rasters
std::vector<fs::path> retained_rasters(StageOutputs const& outputs, OutputType type);

/**
 * Runs the whole reconciliation and publishes the product directory.
 * Every fatal condition is raised as an exception deriving from std::exception;
 * the product directory is only created once all frames were made.
 * @returns: The product directory
 */
fs::path run(Options const& options, Toolbox& tools, RunLog& log);
}
