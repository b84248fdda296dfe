#include <shotocr/app/shot_processor.hpp>
#include <shotocr/core/error.hpp>
#include <shotocr/core/logger.hpp>
#include <shotocr/vision/load_image.hpp>
#include <sstream>

namespace shotocr::app {

namespace sc = shotocr::core;

ShotProcessor::ShotProcessor(PipelineConfig cfg, OcrEngineFactory engines)
    : cfg_(std::move(cfg)) {
  if (!engines) {
    engines = tesseract_engine_factory(cfg_.ocr);
  }
  oled_pipeline_ = build_pipeline(cfg_, sc::DisplayType::Oled, engines());
  tablet_pipeline_ = build_pipeline(cfg_, sc::DisplayType::Tablet, engines());
}

ShotResult ShotProcessor::process_file(const std::string& path, sc::DisplayType display) {
  auto frame = shotocr::vision::load_frame_from_file(path);
  if (!frame) {
    return finish(std::unexpected(frame.error()), path, display);
  }
  auto result = process_frame(*frame, display);
  return finish(std::move(result), path, display);
}

ShotResult ShotProcessor::process_bytes(std::span<const std::byte> encoded,
                                        sc::DisplayType display) {
  auto frame = shotocr::vision::load_frame_from_bytes(encoded);
  const std::string source = "<" + std::to_string(encoded.size()) + " bytes>";
  if (!frame) {
    return finish(std::unexpected(frame.error()), source, display);
  }
  auto result = process_frame(*frame, display);
  return finish(std::move(result), source, display);
}

ShotResult ShotProcessor::process_frame(const sc::Frame& frame, sc::DisplayType display) {
  sc::Pipeline& pipeline =
      display == sc::DisplayType::Tablet ? tablet_pipeline_ : oled_pipeline_;

  if (!stage_timing_) {
    return run_pipeline(pipeline, frame);
  }
  StageTimingCallback timing_cb = [](std::size_t idx, double ms) {
    std::ostringstream msg;
    msg << "stage " << idx << " took " << ms << " ms";
    sc::log_debug(msg.str());
  };
  return run_pipeline(pipeline, frame, &timing_cb);
}

ShotResult ShotProcessor::finish(ShotResult result, std::string_view source,
                                 sc::DisplayType display) const {
  std::ostringstream msg;
  msg << source << " [" << sc::display_name(display) << "]: ";
  if (!result) {
    msg << "failed with " << sc::error_name(result.error());
    sc::log_warning(msg.str());
    return result;
  }
  msg << result->populated_count() << "/" << result->fields().size()
      << " fields, confidence " << result->confidence();
  sc::log_info(msg.str());
  return result;
}

}  // namespace shotocr::app
