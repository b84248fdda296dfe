#include <shotocr/app/config.hpp>
#include <shotocr/core/display_layout.hpp>
#include <shotocr/core/logger.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace sa = shotocr::app;
namespace sc = shotocr::core;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& body) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << body;
  return path;
}

}  // namespace

TEST(Config, DefaultsMatchDisplayTuning) {
  const sa::PipelineConfig c = sa::default_config();
  EXPECT_EQ(c.display, sc::DisplayType::Oled);
  EXPECT_EQ(c.log_level, sc::LogLevel::Info);
  EXPECT_EQ(c.preprocess.bilateral_diameter, 9);
  EXPECT_EQ(c.preprocess.threshold_block_size, 11);
  EXPECT_DOUBLE_EQ(c.preprocess.threshold_offset, 2.0);
  EXPECT_EQ(c.preprocess.morph_kernel_size, 2);
  EXPECT_EQ(c.preprocess.min_height, 500u);
  EXPECT_EQ(c.ocr.page_seg_mode, 6);
}

TEST(Config, MissingFileGivesDefaults) {
  const sa::PipelineConfig c = sa::load_config("/nonexistent/shotocr.conf");
  EXPECT_EQ(c.display, sc::DisplayType::Oled);
  EXPECT_EQ(c.ocr.language, "eng");
}

TEST(Config, ParsesKeysCommentsAndWhitespace) {
  const auto path = write_temp("shotocr_config_test.conf",
                               "# capture rig settings\n"
                               "display = iPad\n"
                               "log_level=debug\n"
                               "\n"
                               "  tessdata_path = /opt/tessdata  \n"
                               "page_seg_mode=7\n"
                               "threshold_block_size=15\n"
                               "threshold_offset=3.5\n"
                               "min_height=720\n"
                               "unknown_key=whatever\n"
                               "no equals sign here\n");
  const sa::PipelineConfig c = sa::load_config(path.string());
  std::filesystem::remove(path);

  EXPECT_EQ(c.display, sc::DisplayType::Tablet);
  EXPECT_EQ(c.log_level, sc::LogLevel::Debug);
  EXPECT_EQ(c.ocr.tessdata_path, "/opt/tessdata");
  EXPECT_EQ(c.ocr.page_seg_mode, 7);
  EXPECT_EQ(c.preprocess.threshold_block_size, 15);
  EXPECT_DOUBLE_EQ(c.preprocess.threshold_offset, 3.5);
  EXPECT_EQ(c.preprocess.min_height, 720u);
  EXPECT_EQ(c.preprocess.bilateral_diameter, 9);
}

TEST(Config, UnknownDisplayKeepsDefault) {
  const auto path = write_temp("shotocr_config_display.conf", "display=crt\n");
  const sa::PipelineConfig c = sa::load_config(path.string());
  std::filesystem::remove(path);
  EXPECT_EQ(c.display, sc::DisplayType::Oled);
}

TEST(Config, MalformedNumberThrows) {
  const auto path = write_temp("shotocr_config_bad.conf", "min_height=tall\n");
  EXPECT_THROW(sa::load_config(path.string()), std::invalid_argument);
  std::filesystem::remove(path);
}
