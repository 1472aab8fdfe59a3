#include "markup.hpp"

namespace p33k::engine {

namespace {

constexpr std::string_view k_open_tag = "<color=";
constexpr std::string_view k_close_tag = "</color>";

} // namespace

std::string strip_color_tags(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '<') {
      std::string_view rest = text.substr(i);
      if (rest.substr(0, k_close_tag.size()) == k_close_tag) {
        i += k_close_tag.size();
        continue;
      }
      if (rest.substr(0, k_open_tag.size()) == k_open_tag) {
        size_t end = rest.find('>', k_open_tag.size());
        // an opening tag needs a non-empty value and a closing bracket
        if (end != std::string_view::npos && end > k_open_tag.size()) {
          i += end + 1;
          continue;
        }
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

} // namespace p33k::engine
