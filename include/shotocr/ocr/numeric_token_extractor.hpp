#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace shotocr::ocr {

/// Ordered values in order of extraction; duplicates are kept.
using NumericSequence = std::vector<double>;

/// Replace common recognizer confusions: 'O'/'o' -> '0', 'l'/'I' -> '1'. Idempotent.
[[nodiscard]] std::string normalize_characters(std::string_view text);

/// Raw OCR text -> NumericSequence.
///
/// After character normalization, unit-suffixed patterns are applied in priority order
/// (mph, ft, degree sign, rpm, /s; case-insensitive), then a generic signed-decimal
/// pattern. Matches are concatenated in that pattern order, so a value printed with a
/// unit appears twice: once from its unit pattern and once from the generic one.
/// Substrings that do not convert to a finite double are dropped.
///
/// Patterns are compiled once; extract() is const and safe to call concurrently.
class NumericTokenExtractor {
 public:
  NumericTokenExtractor();

  [[nodiscard]] NumericSequence extract(std::string_view raw_text) const;

 private:
  std::vector<std::regex> unit_patterns_;
  std::regex generic_pattern_;
};

}  // namespace shotocr::ocr
