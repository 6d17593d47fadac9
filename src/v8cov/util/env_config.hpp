#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <redlog.hpp>

namespace v8cov::util {

// reads typed settings from environment variables sharing a common prefix
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  bool has(const std::string& name) const;

  template <typename T> T get(const std::string& name, T default_value) const;

  std::vector<std::string> get_list(const std::string& name, char delimiter = ',') const;

  std::string build_env_name(const std::string& name) const;

private:
  std::string prefix_;
  redlog::logger log_;

  std::string get_env_value(const std::string& name) const;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;
template <> uint32_t env_config::get<uint32_t>(const std::string& name, uint32_t default_value) const;

} // namespace v8cov::util
