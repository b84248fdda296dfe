#pragma once

#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/ocr/ocr_engine.hpp>
#include <shotocr/ocr/ocr_engine_config.hpp>
#include <memory>
#include <string>

namespace shotocr::ocr {

/// Tesseract recognizer restricted to the numeric display character set.
///
/// The engine is initialised once at construction from OcrEngineConfig (language data
/// path, language, engine mode, page segmentation mode, character whitelist). If
/// initialisation fails, e.g. because the language data is missing, the engine stays
/// unavailable: available() is false and every recognize() returns OcrEngineError.
///
/// Input contract: Grayscale8 frame, normally the output of ImagePreprocessor.
/// Not thread-safe; create one engine per pipeline.
class TesseractOcrEngine : public IOcrEngine {
 public:
  explicit TesseractOcrEngine(OcrEngineConfig config = {});

  ~TesseractOcrEngine() override;

  TesseractOcrEngine(const TesseractOcrEngine&) = delete;
  TesseractOcrEngine& operator=(const TesseractOcrEngine&) = delete;

  [[nodiscard]] std::expected<std::string, shotocr::core::PipelineError>
  recognize(const shotocr::core::Frame& input) override;

  [[nodiscard]] bool available() const noexcept;

  [[nodiscard]] const OcrEngineConfig& config() const noexcept { return config_; }

 private:
  struct Impl;
  OcrEngineConfig config_;
  std::unique_ptr<Impl> impl_;
};

}  // namespace shotocr::ocr
