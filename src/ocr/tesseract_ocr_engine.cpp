#include <shotocr/ocr/tesseract_ocr_engine.hpp>
#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/core/logger.hpp>
#include <tesseract/baseapi.h>
#include <memory>
#include <string>

namespace shotocr::ocr {

struct TesseractOcrEngine::Impl {
  tesseract::TessBaseAPI api;
  bool ready{false};
};

TesseractOcrEngine::TesseractOcrEngine(OcrEngineConfig config)
    : config_(std::move(config)), impl_(std::make_unique<Impl>()) {
  const char* datapath =
      config_.tessdata_path.empty() ? nullptr : config_.tessdata_path.c_str();
  const auto oem = static_cast<tesseract::OcrEngineMode>(config_.engine_mode);

  if (impl_->api.Init(datapath, config_.language.c_str(), oem) != 0) {
    shotocr::core::log_error("Tesseract initialisation failed (language '" +
                             config_.language + "', tessdata '" +
                             config_.tessdata_path + "')");
    return;
  }

  impl_->api.SetPageSegMode(static_cast<tesseract::PageSegMode>(config_.page_seg_mode));
  if (!config_.char_whitelist.empty() &&
      !impl_->api.SetVariable("tessedit_char_whitelist", config_.char_whitelist.c_str())) {
    shotocr::core::log_error("Tesseract rejected the character whitelist");
    impl_->api.End();
    return;
  }
  impl_->ready = true;
}

TesseractOcrEngine::~TesseractOcrEngine() {
  if (impl_) {
    impl_->api.End();
  }
}

bool TesseractOcrEngine::available() const noexcept { return impl_->ready; }

std::expected<std::string, shotocr::core::PipelineError>
TesseractOcrEngine::recognize(const shotocr::core::Frame& input) {
  using shotocr::core::PipelineError;

  if (!impl_->ready) {
    return std::unexpected(PipelineError::OcrEngineError);
  }
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const int width = static_cast<int>(input.width());
  const int height = static_cast<int>(input.height());
  const int bytes_per_line = static_cast<int>(input.size_bytes() / input.height());
  impl_->api.SetImage(reinterpret_cast<const unsigned char*>(input.data().data()),
                      width, height, 1, bytes_per_line);

  if (impl_->api.Recognize(nullptr) != 0) {
    impl_->api.Clear();
    shotocr::core::log_warning("Tesseract recognition failed");
    return std::unexpected(PipelineError::OcrEngineError);
  }

  std::unique_ptr<char[]> text(impl_->api.GetUTF8Text());
  impl_->api.Clear();
  if (!text) {
    shotocr::core::log_warning("Tesseract returned no text buffer");
    return std::unexpected(PipelineError::OcrEngineError);
  }
  return std::string(text.get());
}

}  // namespace shotocr::ocr
