#pragma once

#include <shotocr/core/display_layout.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shotocr::core {

/// One named telemetry value; nullopt when the display position had no number.
struct FieldValue {
  std::string name;
  std::optional<double> value;
};

/// Field values in layout order; exactly one entry per layout field.
using FieldMap = std::vector<FieldValue>;

/// Result of the recognition pipeline for one photograph.
/// Immutable after construction; the caller owns it and decides whether to persist it.
class ShotReading {
 public:
  ShotReading(DisplayType display,
              FieldMap fields,
              double confidence,
              std::string raw_text,
              std::optional<std::string> error = std::nullopt)
      : display_(display),
        fields_(std::move(fields)),
        confidence_(confidence),
        raw_text_(std::move(raw_text)),
        error_(std::move(error)) {}

  [[nodiscard]] DisplayType display() const noexcept { return display_; }
  [[nodiscard]] const FieldMap& fields() const noexcept { return fields_; }
  [[nodiscard]] double confidence() const noexcept { return confidence_; }

  /// Text exactly as returned by the OCR engine, before normalization.
  [[nodiscard]] const std::string& raw_text() const noexcept { return raw_text_; }

  /// Diagnostic note for the persistence layer (e.g. insufficient data). Not a failure.
  [[nodiscard]] const std::optional<std::string>& error() const noexcept {
    return error_;
  }

  /// Value of a field by name; nullopt if the field is null or not in the layout.
  [[nodiscard]] std::optional<double> value(std::string_view field) const;

  /// Number of fields with a value.
  [[nodiscard]] std::size_t populated_count() const noexcept;

 private:
  DisplayType display_;
  FieldMap fields_;
  double confidence_;
  std::string raw_text_;
  std::optional<std::string> error_;
};

}  // namespace shotocr::core
