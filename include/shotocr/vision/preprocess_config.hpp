#pragma once

#include <cstdint>

namespace shotocr::vision {

/// Parameters for turning a display photograph into a recognizer-ready binary image.
/// Defaults suit phone photographs of the OLED panel and the tablet app.
struct PreprocessConfig {
  int bilateral_diameter{9};
  double bilateral_sigma_color{75.0};
  double bilateral_sigma_space{75.0};
  int threshold_block_size{11};  // odd, >= 3
  double threshold_offset{2.0};  // constant C subtracted from the local mean
  int morph_kernel_size{2};
  std::uint32_t min_height{500};  // shorter outputs are upscaled to this height
};

}  // namespace shotocr::vision
