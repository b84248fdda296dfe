#include <shotocr/ocr/confidence_scorer.hpp>
#include <algorithm>

namespace shotocr::ocr {

double ConfidenceScorer::score(std::size_t populated, std::size_t expected) const noexcept {
  if (expected == 0) return 0.0;
  return std::min(1.0, static_cast<double>(populated) / static_cast<double>(expected));
}

}  // namespace shotocr::ocr
