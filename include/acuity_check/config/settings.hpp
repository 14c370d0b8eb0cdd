#pragma once

#include <optional>
#include <string>

#include "acuity_check/calibration/calibration_session.hpp"
#include "acuity_check/chart/chart_lines.hpp"
#include "acuity_check/chart/chart_renderer.hpp"
#include "acuity_check/detector/landmark_strategy.hpp"

struct Settings {
  struct Detection {
    std::string modelPath{"models/onnx/face_detection_yunet_2023mar.onnx"};
    std::string eyeCascadePath{
        "/usr/share/opencv4/haarcascades/"
        "haarcascade_eye_tree_eyeglasses.xml"};
    DetectorParams params;
  };

  struct Chart {
    chart::ChartStyle style{chart::ChartStyle::MIXED};
    char singleLetter{'A'};
    chart::RenderOptions render;
  };

  Detection detection;
  CalibrationSession::DistanceSettings distance;
  // Camera-to-eye distance the viewer sits at for focal length calibration
  double knownDistanceMm{500.0};
  // On-screen width of the rectangle matched to an ID-1 card
  double cardWidthPx{220.0};
  Chart chart;
};

namespace config {

/**
 * Performs tilde expansion for a file path.
 *
 * @param path Path to expand.
 * @return Fully qualified file path.
 */
std::string expandUser(const std::string& path);

/**
 * Normalize the single-letter chart input: whitespace is trimmed, the first
 * character is kept and upper-cased. Empty input yields 'A'.
 */
char normalizeSingleLetter(const std::string& input);

/**
 * Clamp numeric settings to their accepted ranges, warning about every value
 * that had to change.
 */
void clampSettings(Settings& settings);

/**
 * Reads a settings file (OpenCV FileStorage YAML or XML). Missing keys keep
 * their default values; out-of-range values are clamped.
 *
 * @param settingsFile Path to the settings file.
 * @return Settings, or std::nullopt if the file could not be read.
 */
std::optional<Settings> readSettingsFile(const std::string& settingsFile);

}  // namespace config
