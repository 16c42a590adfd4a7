#pragma once

#include "run_log.h"
#include "scene.h"

namespace stack {
/**
 * Brings every scene into the UTM zone of the first scene of the stack.
 * Scenes in another zone are warped to the reference zone (hemisphere aware
 * EPSG code) at the reference pixel size, into "<name>_reproj.tif".
 * Scenes without a recognizable zone are passed through, and a reference
 * without a zone leaves the stack untouched.
 */
StackState reconcile_projections(StackState const& state, RunLog& log);
}
