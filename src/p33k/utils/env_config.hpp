#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace p33k::utils {

// typed access to <PREFIX>_<NAME> environment variables. Values are trimmed; an empty value counts as unset and
// an unparsable one falls back to the default with a warning.
class env_config {
public:
  explicit env_config(std::string prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  // comma separated by default, empty items dropped
  std::vector<std::string> get_list(const std::string& name, char delimiter = ',') const;

  bool has(const std::string& name) const { return lookup(name).has_value(); }

  std::string variable_name(const std::string& name) const { return prefix_ + name; }

private:
  std::string prefix_;

  std::optional<std::string> lookup(const std::string& name) const;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;
template <> uint64_t env_config::get<uint64_t>(const std::string& name, uint64_t default_value) const;

} // namespace p33k::utils
