#include "acuity_check/calibration/calibration_session.hpp"

#include <spdlog/spdlog.h>

#include "acuity_check/chart/optotype.hpp"
#include "acuity_check/geometry/geometry.hpp"

CalibrationSession::CalibrationSession(
    std::shared_ptr<LandmarkDetector> detector,
    const DistanceSettings& settings)
    : detector_{std::move(detector)}, settings_{settings} {}

void CalibrationSession::setScreenScale(double pixelsPerMm) {
  std::lock_guard<std::mutex> lock(mutex_);
  warnings_.clear();

  if (pixelsPerMm < 0.0) {
    addWarning("Screen scale must not be negative.");
    return;
  }

  calibration_.screenPixelsPerMm = pixelsPerMm;
  if (state_ == State::UNCALIBRATED) {
    state_ = State::SCREEN_SCALE_KNOWN;
  }
  spdlog::info("Screen scale set to {:.3f} px/mm", pixelsPerMm);
}

void CalibrationSession::setScreenScaleFromCard(double cardWidthPx) {
  setScreenScale(geometry::pixelsPerMmFromCardWidth(cardWidthPx));
}

void CalibrationSession::setDistanceSettings(
    const DistanceSettings& settings) {
  std::lock_guard<std::mutex> lock(mutex_);
  warnings_.clear();
  settings_ = settings;
  if (calibration_.focalLengthPx && latestPixelIpd_) {
    reestimateDistance();
  }
}

CalibrationSession::DistanceSettings CalibrationSession::getDistanceSettings()
    const {
  std::lock_guard<std::mutex> lock(mutex_);
  return settings_;
}

CalibrationSession::SnapshotResult CalibrationSession::onSnapshot(
    const cv::Mat& frameBgr, const DetectorParams& params) {
  std::lock_guard<std::mutex> lock(mutex_);
  warnings_.clear();

  SnapshotResult result;
  if (detector_) {
    result.detection = detector_->detect(frameBgr, params);
  }
  result.pixelIpd = result.detection.pixelIpd();
  latestPixelIpd_ = result.pixelIpd;

  if (!latestPixelIpd_) {
    addWarning(
        "Could not estimate eyes. Try brighter lighting and face the camera.");
  } else {
    spdlog::info("Pixel IPD: {:.1f} px", *latestPixelIpd_);
  }

  if (!calibration_.focalLengthPx) {
    addWarning(
        "Not calibrated yet. Enter a known distance and calibrate the focal "
        "length.");
    return result;
  }

  if (latestPixelIpd_) {
    result.fieldOfView = geometry::fieldOfView(*calibration_.focalLengthPx,
                                               frameBgr.cols, frameBgr.rows);
    result.eyeToScreenMm = reestimateDistance();
  }
  return result;
}

std::optional<double> CalibrationSession::calibrateFocalLength(
    double knownDistanceMm, double assumedIpdMm) {
  std::lock_guard<std::mutex> lock(mutex_);
  warnings_.clear();

  if (!latestPixelIpd_ || *latestPixelIpd_ <= 0.0) {
    addWarning("Take a snapshot first.");
    return std::nullopt;
  }
  if (knownDistanceMm <= 0.0 || assumedIpdMm <= 0.0) {
    addWarning("Known distance and IPD must be positive.");
    return std::nullopt;
  }

  double focalLength{
      geometry::focalLengthPx(*latestPixelIpd_, knownDistanceMm, assumedIpdMm)};
  calibration_.focalLengthPx = focalLength;
  settings_.assumedIpdMm = assumedIpdMm;
  state_ = State::FOCAL_LENGTH_KNOWN;
  spdlog::info("Calibrated focal length: {:.1f} px", focalLength);

  reestimateDistance();
  return focalLength;
}

double CalibrationSession::getReadingDistanceMm() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return readingDistanceMm();
}

std::vector<ChartRow> CalibrationSession::buildChart(chart::ChartStyle style,
                                                     char singleLetter) const {
  double distanceMm{0.0};
  double pixelsPerMm{0.0};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    distanceMm = readingDistanceMm();
    pixelsPerMm = calibration_.screenPixelsPerMm;
  }

  std::vector<int> denominators(optotype::CANONICAL_DENOMINATORS.begin(),
                                optotype::CANONICAL_DENOMINATORS.end());
  auto rows{optotype::buildRows(distanceMm, pixelsPerMm, denominators)};
  auto lines{chart::buildLines(style, denominators, singleLetter)};
  for (std::size_t i = 0; i < rows.size(); ++i) {
    rows[i].text = lines[i];
  }
  return rows;
}

CalibrationSession::State CalibrationSession::getState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

CalibrationState CalibrationSession::getCalibrationState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calibration_;
}

std::optional<double> CalibrationSession::getLatestPixelIpd() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latestPixelIpd_;
}

std::vector<std::string> CalibrationSession::getWarnings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return warnings_;
}

void CalibrationSession::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  calibration_ = CalibrationState{};
  latestPixelIpd_.reset();
  warnings_.clear();
  state_ = State::UNCALIBRATED;
}

double CalibrationSession::readingDistanceMm() const {
  if (calibration_.eyeToScreenMm && *calibration_.eyeToScreenMm > 0.0) {
    return *calibration_.eyeToScreenMm;
  }
  return optotype::DEFAULT_DISTANCE_MM;
}

std::optional<double> CalibrationSession::reestimateDistance() {
  if (!calibration_.focalLengthPx || !latestPixelIpd_) {
    return std::nullopt;
  }

  DistanceEstimate estimate{geometry::computeDistanceMm(
      *latestPixelIpd_, settings_.assumedIpdMm, *calibration_.focalLengthPx,
      settings_.offsetMm)};
  calibration_.eyeToScreenMm = estimate.eyeToScreenMm;
  state_ = State::DISTANCE_KNOWN;
  spdlog::info("Camera to eye: {:.0f} mm, eye to screen: {:.0f} mm",
               estimate.cameraToEyeMm, estimate.eyeToScreenMm);
  return estimate.eyeToScreenMm;
}

void CalibrationSession::addWarning(const std::string& message) {
  spdlog::warn(message);
  warnings_.push_back(message);
}

std::string toString(CalibrationSession::State state) {
  switch (state) {
    case CalibrationSession::State::UNCALIBRATED:
      return "UNCALIBRATED";
    case CalibrationSession::State::SCREEN_SCALE_KNOWN:
      return "SCREEN_SCALE_KNOWN";
    case CalibrationSession::State::FOCAL_LENGTH_KNOWN:
      return "FOCAL_LENGTH_KNOWN";
    default:
      return "DISTANCE_KNOWN";
  }
}
