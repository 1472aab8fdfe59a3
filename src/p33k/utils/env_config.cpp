#include "env_config.hpp"
#include <redlog.hpp>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string_view>

namespace p33k::utils {

namespace {

redlog::logger env_log = redlog::get_logger("p33k.env");

std::string_view trim_blanks(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

template <typename T> std::optional<T> parse_number(const std::string& text, int base) {
  const char* first = text.data();
  const char* last = text.data() + text.size();
  if (base == 16 && text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    first += 2;
  }
  T value{};
  auto [end, error] = std::from_chars(first, last, value, base);
  if (error != std::errc() || end != last) {
    return std::nullopt;
  }
  return value;
}

template <typename T>
T parsed_or_default(const env_config& env, const std::string& name, std::optional<T> parsed, T default_value) {
  if (!parsed) {
    env_log.wrn("ignoring unparsable value", redlog::field("name", env.variable_name(name)));
    return default_value;
  }
  return *parsed;
}

} // namespace

env_config::env_config(std::string prefix) : prefix_(std::move(prefix)) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_.push_back('_');
  }
}

std::optional<std::string> env_config::lookup(const std::string& name) const {
  const char* raw = std::getenv(variable_name(name).c_str());
  if (raw == nullptr) {
    return std::nullopt;
  }
  std::string_view value = trim_blanks(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  return std::string(value);
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  return lookup(name).value_or(std::move(default_value));
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  auto value = lookup(name);
  if (!value) {
    return default_value;
  }
  for (auto& c : *value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  static const std::array<std::string_view, 4> truthy = {"1", "true", "yes", "on"};
  for (auto word : truthy) {
    if (*value == word) {
      return true;
    }
  }
  return false;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  auto value = lookup(name);
  return value ? parsed_or_default(*this, name, parse_number<int>(*value, 10), default_value) : default_value;
}

// accepts decimal or 0x-prefixed hex
template <> uint64_t env_config::get<uint64_t>(const std::string& name, uint64_t default_value) const {
  auto value = lookup(name);
  if (!value) {
    return default_value;
  }
  bool hex = value->size() > 2 && (*value)[0] == '0' && ((*value)[1] == 'x' || (*value)[1] == 'X');
  return parsed_or_default(*this, name, parse_number<uint64_t>(*value, hex ? 16 : 10), default_value);
}

std::vector<std::string> env_config::get_list(const std::string& name, char delimiter) const {
  std::vector<std::string> items;
  auto value = lookup(name);
  if (!value) {
    return items;
  }

  std::string_view rest = *value;
  while (true) {
    size_t cut = rest.find(delimiter);
    std::string_view item = trim_blanks(rest.substr(0, cut));
    if (!item.empty()) {
      items.emplace_back(item);
    }
    if (cut == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(cut + 1);
  }
  return items;
}

} // namespace p33k::utils
