#pragma once

#include <shotocr/core/display_layout.hpp>
#include <shotocr/core/shot_reading.hpp>
#include <shotocr/ocr/numeric_token_extractor.hpp>

namespace shotocr::ocr {

/// Positional assignment of a NumericSequence onto a DisplayLayout.
///
/// The i-th layout field receives the i-th number if present, else null. The result
/// has exactly one entry per layout field, in layout order. Values are not range-checked.
/// Assumes recognition order matches the display's visual order.
class LayoutFieldMapper {
 public:
  [[nodiscard]] shotocr::core::FieldMap map(const NumericSequence& numbers,
                                            const shotocr::core::DisplayLayout& layout) const;
};

}  // namespace shotocr::ocr
