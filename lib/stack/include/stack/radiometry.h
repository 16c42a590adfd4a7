#pragma once

#include "external.h"
#include "run_log.h"
#include "scene.h"

#include <utility>

namespace stack {
// dB written for pixels without backscatter (power <= 0)
constexpr f32 NO_DATA_DB = -500;

// Per raster transforms. Each one writes a new raster next to its input and
// returns its path.

// Squares amplitude values into power ("_pwr.tif")
fs::path amplitude_to_power(fs::path const& raster);
// Square root of power ("_amp.tif")
fs::path power_to_amplitude(fs::path const& raster);
// 10 * ln(power) ("_dB.tif")
fs::path power_to_decibel(fs::path const& raster);
// Linear stretch of [lower, upper] onto 0..255 ("_dB<lower>_<upper>.tif" for dB input)
fs::path byte_scale(fs::path const& raster, f64 lower, f64 upper);
// Averaging resample to `resolution` map units per pixel ("_<res>m.tif")
fs::path change_resolution(fs::path const& raster, f64 resolution);

/**
 * Enhanced Lee speckle filter through the external tools. The filter reads
 * big-endian float32 samples, so the raw pixels go through
 * swap_bytes -> enh_lee -> swap_bytes. Writes "_sf.tif".
 */
fs::path speckle_filter(fs::path const& raster, ExternalTool& swap_bytes, ExternalTool& filter);

/**
 * Stretch window for sigma-byte output: values above the 98th percentile are
 * clipped, then the window is mean +/- 2 standard deviations of the result.
 */
std::pair<f64, f64> two_sigma_cutoffs(RasterX<f32> const& values);
// Amplitude raster to bytes over its two sigma window ("_sigma.tif")
fs::path sigma_byte(fs::path const& amplitude_raster);

// Stack level versions of the transforms above
StackState amplitude_to_power(StackState const& state, RunLog& log);
StackState filter_stack(StackState const& state, ExternalTool& swap_bytes, ExternalTool& filter, RunLog& log);
StackState change_resolution(StackState const& state, f64 resolution, RunLog& log);
}
