#pragma once

#include <shotocr/app/config.hpp>
#include <shotocr/app/pipeline_builder.hpp>
#include <shotocr/app/pipeline_runner.hpp>
#include <shotocr/core/display_layout.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/core/pipeline.hpp>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace shotocr::app {

/// Entry point for callers that persist readings: image in, ShotReading or error out.
///
/// Holds one pipeline per display type, each with its own OCR engine from the factory.
/// Decode failures are reported as ImageDecodeError before any pipeline stage runs.
/// Not thread-safe; use one ShotProcessor per thread.
class ShotProcessor {
 public:
  /// \param engines Defaults to Tesseract configured from cfg.ocr when empty.
  explicit ShotProcessor(PipelineConfig cfg, OcrEngineFactory engines = {});

  [[nodiscard]] ShotResult process_file(const std::string& path,
                                        shotocr::core::DisplayType display);

  [[nodiscard]] ShotResult process_bytes(std::span<const std::byte> encoded,
                                         shotocr::core::DisplayType display);

  /// Runs an already decoded frame through the pipeline for \p display.
  [[nodiscard]] ShotResult process_frame(const shotocr::core::Frame& frame,
                                         shotocr::core::DisplayType display);

  /// When true, per-stage durations are logged at debug level.
  void set_stage_timing(bool enabled) noexcept { stage_timing_ = enabled; }

  [[nodiscard]] const PipelineConfig& config() const noexcept { return cfg_; }

 private:
  ShotResult finish(ShotResult result, std::string_view source,
                    shotocr::core::DisplayType display) const;

  PipelineConfig cfg_;
  shotocr::core::Pipeline oled_pipeline_;
  shotocr::core::Pipeline tablet_pipeline_;
  bool stage_timing_{false};
};

}  // namespace shotocr::app
