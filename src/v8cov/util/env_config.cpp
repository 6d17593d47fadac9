#include "env_config.hpp"

#include <cstdlib>
#include <exception>

#include "string_utils.hpp"

namespace v8cov::util {

env_config::env_config(const std::string& prefix) : prefix_(prefix), log_(redlog::get_logger("v8cov.env")) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? std::string(value) : std::string();
}

bool env_config::has(const std::string& name) const { return !get_env_value(name).empty(); }

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(trim_view(value));
  if (lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on") {
    return true;
  }
  if (lower_value == "0" || lower_value == "false" || lower_value == "no" || lower_value == "off") {
    return false;
  }

  log_.wrn("unrecognized boolean, using default", redlog::field("name", build_env_name(name)),
           redlog::field("value", value));
  return default_value;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoi(value);
  } catch (const std::exception& e) {
    log_.wrn("failed to parse int, using default", redlog::field("name", build_env_name(name)),
             redlog::field("error", e.what()));
    return default_value;
  }
}

template <> uint32_t env_config::get<uint32_t>(const std::string& name, uint32_t default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    return static_cast<uint32_t>(std::stoul(value));
  } catch (const std::exception& e) {
    log_.wrn("failed to parse uint32_t, using default", redlog::field("name", build_env_name(name)),
             redlog::field("error", e.what()));
    return default_value;
  }
}

std::vector<std::string> env_config::get_list(const std::string& name, char delimiter) const {
  return split_list(get_env_value(name), delimiter);
}

} // namespace v8cov::util
