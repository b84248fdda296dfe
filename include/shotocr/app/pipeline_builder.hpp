#pragma once

#include <shotocr/app/config.hpp>
#include <shotocr/core/display_layout.hpp>
#include <shotocr/core/pipeline.hpp>
#include <shotocr/ocr/ocr_engine.hpp>
#include <functional>
#include <memory>

namespace shotocr::app {

/// Creates a fresh OCR engine. Called once per pipeline; engines are never shared.
using OcrEngineFactory = std::function<std::unique_ptr<shotocr::ocr::IOcrEngine>()>;

/// Creates an independent pipeline (used by the parallel batch runners, one per worker).
using PipelineFactory = std::function<shotocr::core::Pipeline()>;

/// Factory producing TesseractOcrEngine instances configured with a copy of \p config.
[[nodiscard]] OcrEngineFactory tesseract_engine_factory(shotocr::ocr::OcrEngineConfig config);

/// Two stages: ImagePreprocessor (from cfg.preprocess), then ShotRecognitionStage for
/// \p display using \p engine. Throws std::invalid_argument for a null engine or an
/// unusable preprocessing config.
[[nodiscard]] shotocr::core::Pipeline build_pipeline(
    const PipelineConfig& cfg,
    shotocr::core::DisplayType display,
    std::unique_ptr<shotocr::ocr::IOcrEngine> engine);

/// Factory that builds a pipeline for \p display with a new engine from \p engines each call.
[[nodiscard]] PipelineFactory make_pipeline_factory(PipelineConfig cfg,
                                                    shotocr::core::DisplayType display,
                                                    OcrEngineFactory engines);

}  // namespace shotocr::app
