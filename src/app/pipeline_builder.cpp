#include <shotocr/app/pipeline_builder.hpp>
#include <shotocr/ocr/shot_recognition_stage.hpp>
#include <shotocr/ocr/tesseract_ocr_engine.hpp>
#include <shotocr/vision/image_preprocessor.hpp>

namespace shotocr::app {

OcrEngineFactory tesseract_engine_factory(shotocr::ocr::OcrEngineConfig config) {
  return [config = std::move(config)]() -> std::unique_ptr<shotocr::ocr::IOcrEngine> {
    return std::make_unique<shotocr::ocr::TesseractOcrEngine>(config);
  };
}

shotocr::core::Pipeline build_pipeline(
    const PipelineConfig& cfg,
    shotocr::core::DisplayType display,
    std::unique_ptr<shotocr::ocr::IOcrEngine> engine) {
  shotocr::core::Pipeline pipeline;
  pipeline.add_stage(std::make_unique<shotocr::vision::ImagePreprocessor>(cfg.preprocess));
  pipeline.add_stage(
      std::make_unique<shotocr::ocr::ShotRecognitionStage>(std::move(engine), display));
  return pipeline;
}

PipelineFactory make_pipeline_factory(PipelineConfig cfg,
                                      shotocr::core::DisplayType display,
                                      OcrEngineFactory engines) {
  return [cfg = std::move(cfg), display, engines = std::move(engines)]() {
    return build_pipeline(cfg, display, engines());
  };
}

}  // namespace shotocr::app
