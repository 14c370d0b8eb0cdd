#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <filesystem>
#include <opencv2/opencv.hpp>

#include "acuity_check/calibration/calibration_session.hpp"
#include "acuity_check/chart/chart_renderer.hpp"
#include "acuity_check/config/settings.hpp"
#include "acuity_check/detector/landmark_detector.hpp"

namespace {

std::optional<cv::Mat> readFrame(const std::string& imageFile) {
  cv::Mat frame{cv::imread(config::expandUser(imageFile), cv::IMREAD_COLOR)};
  if (frame.empty()) {
    spdlog::error("Unable to read image at path '{}'", imageFile);
    return std::nullopt;
  }
  return frame;
}

}  // namespace

int main(int argc, char* argv[]) {
  CLI::App app{"Measure eye-to-screen distance and size an acuity chart"};

  std::string settingsFile;
  std::string calibrationImageFile;
  std::string imageFile;
  std::string outputDir;
  std::string modelFile;
  std::string eyeCascadeFile;
  std::string chartStyle;
  std::string singleLetter;
  std::string logLevel{"info"};
  float scoreThreshold{0.3f};
  double ipdMm{63.0};
  double offsetMm{40.0};
  double knownDistanceMm{500.0};
  double cardWidthPx{220.0};

  app.add_option("-s,--settings", settingsFile, "Settings file (YAML)")
      ->check(CLI::ExistingFile);
  app.add_option("-c,--calibration_image", calibrationImageFile,
                 "Snapshot taken at the known camera-to-eye distance")
      ->required();
  app.add_option("-i,--image_file", imageFile,
                 "Snapshot to measure (defaults to the calibration image)");
  app.add_option("-o,--output_dir", outputDir,
                 "Directory to write the annotated snapshot and the chart to");
  app.add_option("--model", modelFile, "YuNet face detection ONNX model");
  app.add_option("--eye_cascade", eyeCascadeFile, "Haar eye cascade XML");
  app.add_option("--score_threshold", scoreThreshold,
                 "Face detector score threshold")
      ->check(CLI::Range(0.05f, 0.95f));
  app.add_option("--ipd", ipdMm, "Interpupillary distance (mm)")
      ->check(CLI::Range(40.0, 80.0));
  app.add_option("--offset", offsetMm, "Camera to screen offset (mm)")
      ->check(CLI::Range(0.0, 150.0));
  app.add_option("--known_distance", knownDistanceMm,
                 "Camera to eye distance of the calibration snapshot (mm)")
      ->check(CLI::Range(200.0, 2000.0));
  app.add_option("--card_width_px", cardWidthPx,
                 "On-screen width (px) of a rectangle matched to an ID-1 card")
      ->check(CLI::Range(80.0, 600.0));
  app.add_option("--style", chartStyle,
                 "Chart style: classic, single-letter or mixed");
  app.add_option("--letter", singleLetter, "Letter for the single-letter chart");
  app.add_option("--log_level", logLevel,
                 "Log level: trace, debug, info, warn, error")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));

  CLI11_PARSE(app, argc, argv);

  spdlog::set_level(spdlog::level::from_str(logLevel));

  Settings settings;
  if (!settingsFile.empty()) {
    auto settingsOpt{config::readSettingsFile(settingsFile)};
    if (!settingsOpt) {
      return -1;
    }
    settings = std::move(*settingsOpt);
  }

  // Command line flags take precedence over the settings file
  if (app.count("--model")) {
    settings.detection.modelPath = config::expandUser(modelFile);
  }
  if (app.count("--eye_cascade")) {
    settings.detection.eyeCascadePath = config::expandUser(eyeCascadeFile);
  }
  if (app.count("--score_threshold")) {
    settings.detection.params.scoreThreshold = scoreThreshold;
  }
  if (app.count("--ipd")) {
    settings.distance.assumedIpdMm = ipdMm;
  }
  if (app.count("--offset")) {
    settings.distance.offsetMm = offsetMm;
  }
  if (app.count("--known_distance")) {
    settings.knownDistanceMm = knownDistanceMm;
  }
  if (app.count("--card_width_px")) {
    settings.cardWidthPx = cardWidthPx;
  }
  if (app.count("--style")) {
    settings.chart.style = chart::parseChartStyle(chartStyle);
  }
  if (app.count("--letter")) {
    settings.chart.singleLetter = config::normalizeSingleLetter(singleLetter);
  }
  config::clampSettings(settings);

  auto detector{std::make_shared<LandmarkDetector>(
      settings.detection.modelPath, settings.detection.eyeCascadePath)};
  if (!detector->isPrimaryAvailable()) {
    spdlog::warn(
        "YuNet model not found; pass --model or set detection.model_path");
  }

  CalibrationSession session{detector, settings.distance};
  session.setScreenScaleFromCard(settings.cardWidthPx);

  // Step 1: one-off focal length calibration
  auto calibrationFrameOpt{readFrame(calibrationImageFile)};
  if (!calibrationFrameOpt) {
    return -1;
  }
  session.onSnapshot(*calibrationFrameOpt, settings.detection.params);
  auto focalLengthOpt{session.calibrateFocalLength(
      settings.knownDistanceMm, settings.distance.assumedIpdMm)};
  if (!focalLengthOpt) {
    spdlog::warn("Focal length calibration failed; chart uses {} mm",
                 session.getReadingDistanceMm());
  }

  // Step 2: measure
  cv::Mat frame{*calibrationFrameOpt};
  if (!imageFile.empty()) {
    auto frameOpt{readFrame(imageFile)};
    if (!frameOpt) {
      return -1;
    }
    frame = std::move(*frameOpt);
  }
  auto snapshot{session.onSnapshot(frame, settings.detection.params)};
  if (snapshot.fieldOfView) {
    spdlog::info("FOV {:.1f} x {:.1f} deg (diag {:.1f} deg)",
                 snapshot.fieldOfView->horizontalDeg,
                 snapshot.fieldOfView->verticalDeg,
                 snapshot.fieldOfView->diagonalDeg);
  }
  spdlog::info("State: {}", toString(session.getState()));

  // Step 3: chart
  auto rows{
      session.buildChart(settings.chart.style, settings.chart.singleLetter)};
  fmt::print("Chart for {:.0f} mm at {:.3f} px/mm\n",
             session.getReadingDistanceMm(),
             session.getCalibrationState().screenPixelsPerMm);
  for (const auto& row : rows) {
    fmt::print("{:>5}  {:8.2f} px  {}\n", row.label, row.pixelHeight,
               row.text);
  }

  if (outputDir.empty()) {
    return 0;
  }

  std::filesystem::path outputDirPath{config::expandUser(outputDir)};
  std::filesystem::create_directories(outputDirPath);

  cv::Mat annotated{frame.clone()};
  LandmarkDetector::drawDetections(annotated, snapshot.detection);
  std::filesystem::path imagePath{imageFile.empty() ? calibrationImageFile
                                                    : imageFile};
  std::filesystem::path annotatedPath{
      outputDirPath / (imagePath.stem().string() + "_annotated.jpg")};
  if (!cv::imwrite(annotatedPath.string(), annotated)) {
    spdlog::error("Could not write annotated image to: {}",
                  annotatedPath.string());
    return -1;
  }
  spdlog::info("Saved annotated image to: {}", annotatedPath.string());

  std::filesystem::path chartPath{outputDirPath / "chart.png"};
  cv::Mat chartImage;
  try {
    chartImage = chart::renderChart(rows, settings.chart.render);
  } catch (const cv::Exception& e) {
    spdlog::error("Could not render chart: {}", e.what());
    return -1;
  }
  if (!cv::imwrite(chartPath.string(), chartImage)) {
    spdlog::error("Could not write chart to: {}", chartPath.string());
    return -1;
  }
  spdlog::info("Saved chart to: {}", chartPath.string());

  return 0;
}
