#pragma once

#include <shotocr/core/display_layout.hpp>
#include <shotocr/core/logger.hpp>
#include <shotocr/ocr/ocr_engine_config.hpp>
#include <shotocr/vision/preprocess_config.hpp>
#include <string>

namespace shotocr::app {

/// Pipeline configuration: preprocessing, recognizer, default display, logging.
struct PipelineConfig {
  shotocr::core::DisplayType display{shotocr::core::DisplayType::Oled};
  shotocr::vision::PreprocessConfig preprocess;
  shotocr::ocr::OcrEngineConfig ocr;
  shotocr::core::LogLevel log_level{shotocr::core::LogLevel::Info};
};

/// Load config from a simple key=value file (one per line, '#' comments) or use defaults.
/// Missing file -> defaults. Unknown keys and unrecognised enum values are ignored.
/// Throws std::invalid_argument / std::out_of_range for malformed numbers.
PipelineConfig load_config(const std::string& path);

/// Default config when no file is provided.
PipelineConfig default_config();

}  // namespace shotocr::app
