#pragma once

#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/core/shot_reading.hpp>
#include <expected>
#include <memory>
#include <variant>

namespace shotocr::core {

/// Output of a pipeline stage: either pass-through Frame or final ShotReading.
using StageOutput = std::variant<Frame, ShotReading>;

/// Abstract pipeline stage: process one Frame, return Frame (continue) or ShotReading (done).
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<StageOutput, PipelineError> process(
      const Frame& input) = 0;
};

}  // namespace shotocr::core
