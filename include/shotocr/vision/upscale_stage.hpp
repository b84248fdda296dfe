#pragma once

#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>

namespace shotocr::vision {

/// Upscales frames shorter than min_height to exactly min_height, keeping the aspect
/// ratio (cubic interpolation). Taller frames are copied through.
class UpscaleStage : public shotocr::core::IPipelineStage {
 public:
  explicit UpscaleStage(std::uint32_t min_height);

  [[nodiscard]] std::expected<shotocr::core::StageOutput,
                              shotocr::core::PipelineError>
  process(const shotocr::core::Frame& input) override;

 private:
  std::uint32_t min_height_;
};

}  // namespace shotocr::vision
