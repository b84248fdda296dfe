#include <shotocr/ocr/numeric_token_extractor.hpp>
#include <charconv>
#include <cmath>
#include <iterator>
#include <system_error>

namespace shotocr::ocr {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

// Unit markers in priority order. The degree sign is matched as its UTF-8 bytes.
constexpr const char* kUnitPatterns[] = {
    R"((\d+\.?\d*)\s*mph)",
    R"((\d+\.?\d*)\s*ft)",
    "(\\d+\\.?\\d*)\\s*\xC2\xB0",
    R"((\d+\.?\d*)\s*rpm)",
    R"((\d+\.?\d*)\s*/s)",
};

constexpr const char* kGenericPattern = R"((-?\d+\.?\d*))";

void collect(const std::string& text, const std::regex& pattern, NumericSequence& out) {
  for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
       it != std::sregex_iterator(); ++it) {
    const std::string token = (*it)[1].str();
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc() || ptr == token.data() || !std::isfinite(value)) {
      continue;
    }
    out.push_back(value);
  }
}

}  // namespace

std::string normalize_characters(std::string_view text) {
  std::string out(text);
  for (char& c : out) {
    switch (c) {
      case 'O':
      case 'o':
        c = '0';
        break;
      case 'l':
      case 'I':
        c = '1';
        break;
      default:
        break;
    }
  }
  return out;
}

NumericTokenExtractor::NumericTokenExtractor()
    : generic_pattern_(kGenericPattern, kFlags) {
  unit_patterns_.reserve(std::size(kUnitPatterns));
  for (const char* pattern : kUnitPatterns) {
    unit_patterns_.emplace_back(pattern, kFlags);
  }
}

NumericSequence NumericTokenExtractor::extract(std::string_view raw_text) const {
  const std::string text = normalize_characters(raw_text);

  NumericSequence numbers;
  for (const auto& pattern : unit_patterns_) {
    collect(text, pattern, numbers);
  }
  collect(text, generic_pattern_, numbers);
  return numbers;
}

}  // namespace shotocr::ocr
