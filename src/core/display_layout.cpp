#include <shotocr/core/display_layout.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace shotocr::core {

std::optional<std::size_t> DisplayLayout::index_of(std::string_view field) const {
  const auto it = std::find(fields_.begin(), fields_.end(), field);
  if (it == fields_.end()) return std::nullopt;
  return static_cast<std::size_t>(it - fields_.begin());
}

const DisplayLayout& oled_layout() {
  static const DisplayLayout layout("oled", {
      "ball_speed",
      "club_head_speed",
      "carry_distance",
      "total_distance",
  });
  return layout;
}

const DisplayLayout& tablet_layout() {
  static const DisplayLayout layout("tablet", {
      "ball_speed",
      "club_head_speed",
      "smash_factor",
      "carry_distance",
      "total_distance",
      "launch_angle",
      "spin_rate",
      "side_spin",
      "angle_of_attack",
      "club_path",
      "face_angle",
      "dynamic_loft",
      "impact_height",
      "impact_toe",
      "ball_height",
      "descent_angle",
  });
  return layout;
}

const DisplayLayout& layout_for(DisplayType display) {
  return display == DisplayType::Tablet ? tablet_layout() : oled_layout();
}

std::string_view display_name(DisplayType display) noexcept {
  switch (display) {
    case DisplayType::Oled:
      return "oled";
    case DisplayType::Tablet:
      return "tablet";
  }
  return "unknown";
}

std::optional<DisplayType> parse_display_type(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "oled") return DisplayType::Oled;
  if (lower == "tablet" || lower == "ipad") return DisplayType::Tablet;
  return std::nullopt;
}

}  // namespace shotocr::core
