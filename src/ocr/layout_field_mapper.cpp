#include <shotocr/ocr/layout_field_mapper.hpp>

namespace shotocr::ocr {

shotocr::core::FieldMap LayoutFieldMapper::map(
    const NumericSequence& numbers,
    const shotocr::core::DisplayLayout& layout) const {
  shotocr::core::FieldMap out;
  out.reserve(layout.size());
  const auto& fields = layout.fields();
  for (std::size_t i = 0; i < fields.size(); ++i) {
    shotocr::core::FieldValue fv;
    fv.name = fields[i];
    if (i < numbers.size()) {
      fv.value = numbers[i];
    }
    out.push_back(std::move(fv));
  }
  return out;
}

}  // namespace shotocr::ocr
