#include <shotocr/core/error.hpp>

namespace shotocr::core {

std::string_view error_name(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "None";
    case PipelineError::ImageDecodeError:
      return "ImageDecodeError";
    case PipelineError::OcrEngineError:
      return "OcrEngineError";
    case PipelineError::InvalidFrame:
      return "InvalidFrame";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

}  // namespace shotocr::core
