#pragma once

#include <string>
#include <string_view>

namespace p33k::engine {

// removes <color=...> and </color> rich-text tags, leaving all other text intact
std::string strip_color_tags(std::string_view text);

} // namespace p33k::engine
