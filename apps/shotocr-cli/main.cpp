/**
 * shotocr-cli: read golf-shot telemetry from photographs of the OLED panel or tablet app.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/shotocr_cli [--config path] [--display oled|tablet] --input photo.jpg [...]
 * Each reading is printed and also written to output/<basename>.txt (same content as terminal).
 */

#include <shotocr/app/config.hpp>
#include <shotocr/app/pipeline_builder.hpp>
#include <shotocr/app/shot_processor.hpp>
#include <shotocr/core/display_layout.hpp>
#include <shotocr/core/error.hpp>
#include <shotocr/core/logger.hpp>
#include <shotocr/core/shot_reading.hpp>
#include <shotocr/ocr/mock_ocr_engine.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string format_reading(const std::string& source, const shotocr::core::ShotReading& r) {
  std::ostringstream out;
  out << "source=" << source << " display=" << shotocr::core::display_name(r.display())
      << " confidence=" << r.confidence() << "\n";
  for (const auto& f : r.fields()) {
    out << "  " << f.name << "=";
    if (f.value) {
      out << *f.value;
    } else {
      out << "null";
    }
    out << "\n";
  }
  if (r.error()) out << "note: " << *r.error() << "\n";
  out << "raw_text:\n" << r.raw_text();
  if (!r.raw_text().empty() && r.raw_text().back() != '\n') out << "\n";
  return out.str();
}

void write_output_file(const std::string& input_path, const std::string& text) {
  std::filesystem::path p(input_path);
  std::filesystem::path out_dir("output");
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    shotocr::core::log_warning("could not create " + out_dir.string() + ": " + ec.message());
    return;
  }
  std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
  std::ofstream f(out_file);
  if (f) {
    f << text;
  } else {
    shotocr::core::log_warning("could not write " + out_file.string());
  }
}

void print_usage() {
  std::cout << "Usage: shotocr_cli [options] --input <path> [--input <path> ...]\n"
            << "  --config <path>     Pipeline config (key=value file); default: built-in\n"
            << "  --display <type>    oled | tablet (default from config: oled)\n"
            << "  --tessdata <dir>    Override Tesseract language data directory\n"
            << "  --mock-text <text>  Skip Tesseract; treat <text> as the recognized text\n"
            << "  --log-level <lvl>   debug | info | warning | error\n"
            << "  --timing            Log per-stage durations (debug level)\n"
            << "  --input <path>      Display photograph; may be repeated\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> inputs;
  std::string display_override;
  std::string tessdata_override;
  std::string log_level_override;
  std::optional<std::string> mock_text;
  bool timing = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      inputs.emplace_back(argv[++i]);
    } else if (arg == "--display" && i + 1 < argc) {
      display_override = argv[++i];
    } else if (arg == "--tessdata" && i + 1 < argc) {
      tessdata_override = argv[++i];
    } else if (arg == "--mock-text" && i + 1 < argc) {
      mock_text = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--timing") {
      timing = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  if (inputs.empty()) {
    print_usage();
    return 1;
  }

  shotocr::app::PipelineConfig cfg;
  try {
    cfg = config_path.empty() ? shotocr::app::default_config()
                              : shotocr::app::load_config(config_path);
  } catch (const std::exception& e) {
    std::cerr << "Invalid config " << config_path << ": " << e.what() << "\n";
    return 1;
  }

  if (!display_override.empty()) {
    auto display = shotocr::core::parse_display_type(display_override);
    if (!display) {
      std::cerr << "Unknown --display " << display_override << " (use oled or tablet)\n";
      return 1;
    }
    cfg.display = *display;
  }
  if (!tessdata_override.empty()) {
    cfg.ocr.tessdata_path = tessdata_override;
  }
  if (!log_level_override.empty()) {
    auto level = shotocr::core::parse_log_level(log_level_override);
    if (!level) {
      std::cerr << "Unknown --log-level " << log_level_override << "\n";
      return 1;
    }
    cfg.log_level = *level;
  }
  shotocr::core::set_log_level(cfg.log_level);

  shotocr::app::OcrEngineFactory engines;
  if (mock_text) {
    engines = [text = *mock_text]() -> std::unique_ptr<shotocr::ocr::IOcrEngine> {
      return std::make_unique<shotocr::ocr::MockOcrEngine>(text);
    };
  }

  std::optional<shotocr::app::ShotProcessor> processor;
  try {
    processor.emplace(cfg, std::move(engines));
  } catch (const std::invalid_argument& e) {
    std::cerr << "Invalid pipeline configuration: " << e.what() << "\n";
    return 1;
  }
  processor->set_stage_timing(timing);

  int exit_code = 0;
  for (const auto& input : inputs) {
    auto result = processor->process_file(input, cfg.display);
    if (!result) {
      std::cerr << input << ": " << shotocr::core::error_name(result.error()) << "\n";
      exit_code = 1;
      continue;
    }
    const std::string text = format_reading(input, *result);
    std::cout << text;
    write_output_file(input, text);
  }
  return exit_code;
}
