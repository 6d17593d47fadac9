#pragma once

#include "process_coverage.hpp"

namespace v8cov::profile {

/**
 * detects the synthetic module the runtime creates when ESM imports a CommonJS module.
 *
 * the bridge has exactly three functions: an anonymous block-coverage module body and
 * non-block "get" and "set" accessors. its coverage shadows the real module's record.
 */
bool is_cjs_esm_bridge(const script_coverage& script);

} // namespace v8cov::profile
