#include <shotocr/core/shot_reading.hpp>
#include <algorithm>

namespace shotocr::core {

std::optional<double> ShotReading::value(std::string_view field) const {
  const auto it = std::find_if(fields_.begin(), fields_.end(),
                               [field](const FieldValue& f) { return f.name == field; });
  if (it == fields_.end()) return std::nullopt;
  return it->value;
}

std::size_t ShotReading::populated_count() const noexcept {
  return static_cast<std::size_t>(
      std::count_if(fields_.begin(), fields_.end(),
                    [](const FieldValue& f) { return f.value.has_value(); }));
}

}  // namespace shotocr::core
