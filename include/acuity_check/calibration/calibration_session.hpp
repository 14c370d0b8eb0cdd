#pragma once

#include <memory>
#include <mutex>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

#include "acuity_check/chart/chart_lines.hpp"
#include "acuity_check/common_types.hpp"
#include "acuity_check/detector/landmark_detector.hpp"

struct CalibrationState {
  // Screen scale from the card calibration step; 0 until set
  double screenPixelsPerMm{0.0};
  // Camera focal length from the one-shot calibration step
  std::optional<double> focalLengthPx;
  // Most recent eye-to-screen distance estimate
  std::optional<double> eyeToScreenMm;
};

/**
 * Sequences screen-scale calibration, snapshot detection, focal length
 * calibration and continuous distance re-estimation for one user session.
 *
 * Every public method is one user-triggered step. Steps are serialized by an
 * internal mutex, so a session may be shared between threads. Warnings raised
 * by the most recent step are available from getWarnings().
 */
class CalibrationSession {
 public:
  enum class State {
    UNCALIBRATED,
    SCREEN_SCALE_KNOWN,
    // Focal length stored, no distance estimated yet. calibrateFocalLength
    // always has a pixel IPD to estimate with, so it passes through this
    // state to DISTANCE_KNOWN within the same call.
    FOCAL_LENGTH_KNOWN,
    DISTANCE_KNOWN
  };

  struct DistanceSettings {
    // Viewer's real interpupillary distance
    double assumedIpdMm{63.0};
    // Camera to screen plane offset subtracted from camera-to-eye distance
    double offsetMm{40.0};
  };

  struct SnapshotResult {
    LandmarkDetector::Result detection;
    std::optional<double> pixelIpd;
    // Camera field of view, once the focal length is known
    std::optional<FieldOfView> fieldOfView;
    // Eye-to-screen distance re-estimated from this snapshot
    std::optional<double> eyeToScreenMm;
  };

  explicit CalibrationSession(std::shared_ptr<LandmarkDetector> detector,
                              const DistanceSettings& settings = {});
  CalibrationSession(const CalibrationSession&) = delete;
  CalibrationSession& operator=(const CalibrationSession&) = delete;

  /**
   * Store the screen scale. Leaves focal length and distance untouched.
   *
   * @param pixelsPerMm Screen pixels per millimetre. Negative values are
   * rejected with a warning.
   */
  void setScreenScale(double pixelsPerMm);

  /**
   * Store the screen scale derived from the on-screen width of a rectangle
   * matched to a physical ID-1 card.
   */
  void setScreenScaleFromCard(double cardWidthPx);

  /**
   * Update the distance inputs, then re-estimate the distance if a focal
   * length and a latest pixel IPD are both available.
   */
  void setDistanceSettings(const DistanceSettings& settings);
  DistanceSettings getDistanceSettings() const;

  /**
   * Run landmark detection on a snapshot. On success the pixel IPD becomes
   * the latest IPD; on failure the latest IPD is cleared but the calibrated
   * focal length and the last distance estimate are kept. If a focal length
   * is known, the distance is re-estimated.
   *
   * @param frameBgr Snapshot (CV_8UC3, BGR).
   * @param params Detection thresholds.
   */
  SnapshotResult onSnapshot(const cv::Mat& frameBgr,
                            const DetectorParams& params = {});

  /**
   * Compute and store the focal length from the latest pixel IPD, taken while
   * the viewer sat at a known camera-to-eye distance. The assumed IPD also
   * becomes the IPD used for distance estimation, and the distance is
   * re-estimated from the same pixel IPD, so a successful call leaves the
   * session in State::DISTANCE_KNOWN. Does nothing but warn if there is no
   * latest pixel IPD or an input is not positive.
   *
   * @param knownDistanceMm Measured camera-to-eye distance, in mm.
   * @param assumedIpdMm Viewer's real interpupillary distance, in mm.
   * @return Calibrated focal length in pixels, or std::nullopt if the step
   * was rejected.
   */
  std::optional<double> calibrateFocalLength(double knownDistanceMm,
                                             double assumedIpdMm);

  /**
   * Distance used to size the chart: the eye-to-screen estimate, or
   * optotype::DEFAULT_DISTANCE_MM if none is available.
   */
  double getReadingDistanceMm() const;

  /**
   * Chart rows for the canonical denominators, sized for the reading
   * distance and the stored screen scale.
   */
  std::vector<ChartRow> buildChart(chart::ChartStyle style,
                                   char singleLetter = 'A') const;

  State getState() const;
  CalibrationState getCalibrationState() const;
  std::optional<double> getLatestPixelIpd() const;
  std::vector<std::string> getWarnings() const;

  /**
   * Return to UNCALIBRATED, clearing scale, focal length, distance and the
   * latest pixel IPD.
   */
  void reset();

 private:
  // Callers must hold mutex_
  std::optional<double> reestimateDistance();
  double readingDistanceMm() const;
  void addWarning(const std::string& message);

  std::shared_ptr<LandmarkDetector> detector_;
  DistanceSettings settings_;
  CalibrationState calibration_;
  std::optional<double> latestPixelIpd_;
  State state_{State::UNCALIBRATED};
  std::vector<std::string> warnings_;
  mutable std::mutex mutex_;
};

std::string toString(CalibrationSession::State state);
