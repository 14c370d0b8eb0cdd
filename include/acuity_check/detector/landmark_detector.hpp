#pragma once

#include <memory>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

#include "acuity_check/detector/landmark_strategy.hpp"

class LandmarkDetector {
 public:
  struct EyePair {
    // Eye centre with the smaller x
    cv::Point2f left;
    cv::Point2f right;
  };

  struct Result {
    // Face bounding box (TLWH), from the first strategy that produced one
    std::optional<cv::Rect2f> box;
    // Landmarks of the strategy that produced the eye pair
    std::optional<std::vector<cv::Point2f>> landmarks;
    std::optional<EyePair> eyes;
    // Name of the strategy that produced the eye pair
    std::string source;

    /**
     * Euclidean distance between the eye centres, in pixels, or std::nullopt
     * if no eye pair was found.
     */
    std::optional<double> pixelIpd() const;
  };

  /**
   * Build an eye pair from the first two landmark points, sorted by
   * ascending x. Requires at least two points.
   */
  static EyePair makeEyePair(const std::vector<cv::Point2f>& points);

  /**
   * Draw the face box and landmarks onto an image of the same size as the
   * frame the detection was run on.
   */
  static void drawDetections(cv::Mat& targetImage, const Result& result,
                             cv::Scalar boxColor = {0, 200, 255},
                             cv::Scalar pointColor = {0, 255, 0});

  /**
   * Detector with YuNet as the primary strategy and the Haar eye cascade as
   * the fallback.
   *
   * @param modelFile Path to the YuNet ONNX model.
   * @param eyeCascadeFile Path to the Haar eye cascade XML.
   */
  explicit LandmarkDetector(const std::string& modelFile,
                            const std::string& eyeCascadeFile);
  /**
   * Detector with a custom priority-ordered list of strategies.
   */
  explicit LandmarkDetector(
      std::vector<std::unique_ptr<LandmarkStrategy>> strategies);
  LandmarkDetector(const LandmarkDetector&) = delete;
  LandmarkDetector& operator=(const LandmarkDetector&) = delete;
  LandmarkDetector(LandmarkDetector&&) noexcept = default;
  LandmarkDetector& operator=(LandmarkDetector&&) noexcept = default;
  ~LandmarkDetector() = default;

  /**
   * Locate a face and an eye pair. Strategies are tried in order; the face
   * box found by one is passed on to the next, and the first strategy that
   * yields at least 2 landmark points wins. Unavailable strategies are
   * skipped.
   *
   * @param frameBgr Frame to search (CV_8UC3, BGR).
   * @param params Detection thresholds.
   * @return Detection result. `eyes` is empty if no strategy found 2 points.
   */
  Result detect(const cv::Mat& frameBgr, const DetectorParams& params = {});

  /**
   * Whether the primary (first) strategy can run.
   */
  bool isPrimaryAvailable() const;

 private:
  std::vector<std::unique_ptr<LandmarkStrategy>> strategies_;
};
