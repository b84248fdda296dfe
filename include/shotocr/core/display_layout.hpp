#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shotocr::core {

/// Which display surface the photograph shows.
enum class DisplayType : std::uint8_t {
  Oled,    // on-device panel, 4 values
  Tablet,  // companion app screen, 16 values
};

/// Ordered field identifiers expected on a display, in reading order.
/// Field order defines positional assignment and is never changed after construction.
class DisplayLayout {
 public:
  DisplayLayout(std::string name, std::vector<std::string> fields)
      : name_(std::move(name)), fields_(std::move(fields)) {}

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const std::vector<std::string>& fields() const noexcept {
    return fields_;
  }
  [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }

  /// Index of a field in reading order, or nullopt if the layout does not have it.
  [[nodiscard]] std::optional<std::size_t> index_of(std::string_view field) const;

 private:
  std::string name_;
  std::vector<std::string> fields_;
};

/// Built-in layouts. Returned by reference to process-lifetime constants.
[[nodiscard]] const DisplayLayout& oled_layout();
[[nodiscard]] const DisplayLayout& tablet_layout();
[[nodiscard]] const DisplayLayout& layout_for(DisplayType display);

/// "oled" or "tablet".
[[nodiscard]] std::string_view display_name(DisplayType display) noexcept;

/// Case-insensitive; accepts "oled", "tablet" and "ipad". nullopt otherwise.
[[nodiscard]] std::optional<DisplayType> parse_display_type(std::string_view text);

}  // namespace shotocr::core
