#include "acuity_check/config/settings.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <opencv2/core/persistence.hpp>
#include <stdexcept>

namespace {

template <typename T>
void clampValue(T& value, T min, T max, const char* name) {
  T clamped{std::clamp(value, min, max)};
  if (clamped != value) {
    spdlog::warn("{} = {} is out of range [{}, {}]; using {}", name, value,
                 min, max, clamped);
    value = clamped;
  }
}

void readDouble(const cv::FileNode& node, const char* key, double& value) {
  cv::FileNode child{node[key]};
  if (!child.isNone() && child.isReal()) {
    value = static_cast<double>(child);
  } else if (!child.isNone() && child.isInt()) {
    value = static_cast<int>(child);
  }
}

void readFloat(const cv::FileNode& node, const char* key, float& value) {
  double tmp{value};
  readDouble(node, key, tmp);
  value = static_cast<float>(tmp);
}

void readInt(const cv::FileNode& node, const char* key, int& value) {
  cv::FileNode child{node[key]};
  if (!child.isNone() && child.isInt()) {
    value = static_cast<int>(child);
  }
}

void readString(const cv::FileNode& node, const char* key,
                std::string& value) {
  cv::FileNode child{node[key]};
  if (!child.isNone() && child.isString()) {
    value = static_cast<std::string>(child);
  }
}

}  // namespace

std::string config::expandUser(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }

  const char* home{std::getenv("HOME")};
  if (!home) {
    throw std::runtime_error("HOME environment variable not set");
  }

  return std::string(home) + path.substr(1);
}

char config::normalizeSingleLetter(const std::string& input) {
  auto it{std::find_if(input.begin(), input.end(), [](unsigned char c) {
    return !std::isspace(c);
  })};
  if (it == input.end()) {
    return 'A';
  }
  return static_cast<char>(std::toupper(static_cast<unsigned char>(*it)));
}

void config::clampSettings(Settings& settings) {
  clampValue(settings.detection.params.scoreThreshold, 0.05f, 0.95f,
             "detection.score_threshold");
  clampValue(settings.detection.params.nmsThreshold, 0.0f, 1.0f,
             "detection.nms_threshold");
  clampValue(settings.detection.params.topK, 1, 10000, "detection.top_k");
  clampValue(settings.distance.assumedIpdMm, 40.0, 80.0, "distance.ipd_mm");
  clampValue(settings.distance.offsetMm, 0.0, 150.0, "distance.offset_mm");
  clampValue(settings.knownDistanceMm, 200.0, 2000.0,
             "distance.known_distance_mm");
  clampValue(settings.cardWidthPx, 80.0, 600.0, "screen.card_width_px");
  clampValue(settings.chart.render.letterSpacingEm, 0.0, 0.2,
             "chart.letter_spacing_em");
}

std::optional<Settings> config::readSettingsFile(
    const std::string& settingsFile) {
  std::filesystem::path filePath{config::expandUser(settingsFile)};
  std::error_code ec;
  if (!std::filesystem::exists(filePath, ec)) {
    spdlog::error("Settings file does not exist: {}{}", filePath.string(),
                  ec ? " (" + ec.message() + ")" : "");
    return std::nullopt;
  }

  cv::FileStorage fs;
  try {
    fs.open(filePath.string(), cv::FileStorage::READ);
  } catch (const cv::Exception& e) {
    spdlog::error("Could not parse settings file {}: {}", filePath.string(),
                  e.what());
    return std::nullopt;
  }
  if (!fs.isOpened()) {
    spdlog::error("Could not read settings file: {}", filePath.string());
    return std::nullopt;
  }

  Settings settings;

  cv::FileNode detection{fs["detection"]};
  if (!detection.isNone()) {
    readString(detection, "model_path", settings.detection.modelPath);
    readString(detection, "eye_cascade_path",
               settings.detection.eyeCascadePath);
    readFloat(detection, "score_threshold",
              settings.detection.params.scoreThreshold);
    readFloat(detection, "nms_threshold",
              settings.detection.params.nmsThreshold);
    readInt(detection, "top_k", settings.detection.params.topK);
  }
  settings.detection.modelPath = expandUser(settings.detection.modelPath);
  settings.detection.eyeCascadePath =
      expandUser(settings.detection.eyeCascadePath);

  cv::FileNode distance{fs["distance"]};
  if (!distance.isNone()) {
    readDouble(distance, "ipd_mm", settings.distance.assumedIpdMm);
    readDouble(distance, "offset_mm", settings.distance.offsetMm);
    readDouble(distance, "known_distance_mm", settings.knownDistanceMm);
  }

  cv::FileNode screen{fs["screen"]};
  if (!screen.isNone()) {
    readDouble(screen, "card_width_px", settings.cardWidthPx);
  }

  cv::FileNode chartNode{fs["chart"]};
  if (!chartNode.isNone()) {
    std::string style{chart::toString(settings.chart.style)};
    readString(chartNode, "style", style);
    settings.chart.style = chart::parseChartStyle(style);

    std::string letter(1, settings.chart.singleLetter);
    readString(chartNode, "single_letter", letter);
    settings.chart.singleLetter = normalizeSingleLetter(letter);

    std::string polarity;
    readString(chartNode, "polarity", polarity);
    if (!polarity.empty()) {
      settings.chart.render.polarity = chart::parsePolarity(polarity);
    }

    readDouble(chartNode, "letter_spacing_em",
               settings.chart.render.letterSpacingEm);

    int showLabels{settings.chart.render.showLabels ? 1 : 0};
    readInt(chartNode, "show_labels", showLabels);
    settings.chart.render.showLabels = showLabels != 0;
  }

  fs.release();

  clampSettings(settings);
  return settings;
}
