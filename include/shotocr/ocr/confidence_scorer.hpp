#pragma once

#include <cstddef>

namespace shotocr::ocr {

/// Coverage-based confidence: populated / expected, capped at 1.0.
/// 0.0 when nothing is expected. Says nothing about whether the values are correct.
class ConfidenceScorer {
 public:
  [[nodiscard]] double score(std::size_t populated, std::size_t expected) const noexcept;
};

}  // namespace shotocr::ocr
