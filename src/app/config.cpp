#include <shotocr/app/config.hpp>
#include <fstream>
#include <string_view>

namespace shotocr::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

}  // namespace

PipelineConfig default_config() {
  return PipelineConfig{};
}

PipelineConfig load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "display") {
      if (auto d = shotocr::core::parse_display_type(value)) c.display = *d;
    }
    else if (key == "log_level") {
      if (auto l = shotocr::core::parse_log_level(value)) c.log_level = *l;
    }
    else if (key == "tessdata_path") c.ocr.tessdata_path = value;
    else if (key == "language") c.ocr.language = value;
    else if (key == "engine_mode") c.ocr.engine_mode = std::stoi(value);
    else if (key == "page_seg_mode") c.ocr.page_seg_mode = std::stoi(value);
    else if (key == "char_whitelist") c.ocr.char_whitelist = value;
    else if (key == "bilateral_diameter") c.preprocess.bilateral_diameter = std::stoi(value);
    else if (key == "bilateral_sigma_color") c.preprocess.bilateral_sigma_color = std::stod(value);
    else if (key == "bilateral_sigma_space") c.preprocess.bilateral_sigma_space = std::stod(value);
    else if (key == "threshold_block_size") c.preprocess.threshold_block_size = std::stoi(value);
    else if (key == "threshold_offset") c.preprocess.threshold_offset = std::stod(value);
    else if (key == "morph_kernel_size") c.preprocess.morph_kernel_size = std::stoi(value);
    else if (key == "min_height") c.preprocess.min_height = static_cast<std::uint32_t>(std::stoul(value));
  }
  return c;
}

}  // namespace shotocr::app
