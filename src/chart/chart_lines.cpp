#include "acuity_check/chart/chart_lines.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

// Letter "O", never the digit zero
const std::array<std::string, 8> CLASSIC_LINES{
    "E", "FP", "TOZ", "LPED", "PECFD", "EDFCZP", "FELOPZD", "DEFPOTEC"};

constexpr const char* SLOAN_LETTERS{"CDHKNORSVZ"};
constexpr std::size_t NUM_SLOAN_LETTERS{10};

std::size_t lineLength(std::size_t lineIdx) {
  return std::clamp<std::size_t>(2 + lineIdx, 2, 10);
}

std::string toLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

}  // namespace

chart::ChartStyle chart::parseChartStyle(const std::string& name) {
  std::string lower{toLower(name)};
  if (lower == "classic snellen" || lower == "classic") {
    return ChartStyle::CLASSIC;
  }
  if (lower == "single letter" || lower == "single-letter") {
    return ChartStyle::SINGLE_LETTER;
  }
  return ChartStyle::MIXED;
}

std::string chart::toString(ChartStyle style) {
  switch (style) {
    case ChartStyle::CLASSIC:
      return "classic";
    case ChartStyle::SINGLE_LETTER:
      return "single-letter";
    default:
      return "mixed";
  }
}

std::vector<std::string> chart::buildLines(
    ChartStyle style, const std::vector<int>& denominators,
    char singleLetter) {
  std::size_t numLines{denominators.size()};
  std::vector<std::string> lines;
  lines.reserve(numLines);

  switch (style) {
    case ChartStyle::CLASSIC:
      // Truncate from the top, then repeat the last line for any overflow
      for (std::size_t i = 0; i < numLines; ++i) {
        lines.push_back(CLASSIC_LINES[std::min(i, CLASSIC_LINES.size() - 1)]);
      }
      break;
    case ChartStyle::SINGLE_LETTER:
      for (std::size_t i = 0; i < numLines; ++i) {
        lines.emplace_back(lineLength(i), singleLetter);
      }
      break;
    case ChartStyle::MIXED:
      for (std::size_t i = 0; i < numLines; ++i) {
        std::string line;
        for (std::size_t j = 0; j < lineLength(i); ++j) {
          line.push_back(SLOAN_LETTERS[(j + i) % NUM_SLOAN_LETTERS]);
        }
        lines.push_back(line);
      }
      break;
  }

  return lines;
}
