#include "cjs_esm_bridge.hpp"

namespace v8cov::profile {

bool is_cjs_esm_bridge(const script_coverage& script) {
  const auto& functions = script.functions;
  return functions.size() == 3 && functions[0].function_name.empty() && functions[0].is_block_coverage &&
         functions[1].function_name == "get" && !functions[1].is_block_coverage &&
         functions[2].function_name == "set" && !functions[2].is_block_coverage;
}

} // namespace v8cov::profile
