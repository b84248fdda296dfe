#pragma once

#include <string>

namespace shotocr::ocr {

/// Characters the recognizer may emit: digits, sign, decimal point, and the glyphs of
/// the unit markers printed next to values (mph, degrees, ft, /s).
inline constexpr const char* kDefaultCharWhitelist = "0123456789.-+mph°ft/s";

/// Recognizer settings. Passed by value at engine construction and never changed after.
struct OcrEngineConfig {
  std::string tessdata_path;  // empty = engine's compiled-in default
  std::string language{"eng"};
  int engine_mode{3};      // tesseract::OcrEngineMode, 3 = OEM_DEFAULT
  int page_seg_mode{6};    // tesseract::PageSegMode, 6 = PSM_SINGLE_BLOCK
  std::string char_whitelist{kDefaultCharWhitelist};
};

}  // namespace shotocr::ocr
