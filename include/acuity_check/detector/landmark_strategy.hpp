#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

struct DetectorParams {
  // Minimum confidence for a face candidate to be kept
  float scoreThreshold{0.3f};
  // IoU threshold used for non-maximum suppression
  float nmsThreshold{0.3f};
  // Number of candidates kept before non-maximum suppression
  int topK{5000};
};

struct FaceLandmarks {
  // Face bounding box (TLWH), if the strategy produces one
  std::optional<cv::Rect2f> box;
  // Landmark points in frame coordinates. The first two are eye centres.
  std::vector<cv::Point2f> points;
};

/**
 * One way of locating a face and its eyes in a frame. Strategies are tried in
 * priority order by LandmarkDetector.
 */
class LandmarkStrategy {
 public:
  virtual ~LandmarkStrategy() = default;

  virtual std::string getName() const = 0;

  /**
   * Whether the strategy's model artifact was resolved and loaded.
   */
  virtual bool isAvailable() const = 0;

  /**
   * Locate a face and its landmarks.
   *
   * @param frameBgr Frame to search (CV_8UC3, BGR).
   * @param faceBox Face box found by a higher-priority strategy, if any.
   * @param params Detection thresholds.
   * @return Detected box and landmarks, or std::nullopt if nothing was found.
   * Absence is an expected outcome and is never reported by throwing.
   */
  virtual std::optional<FaceLandmarks> detect(
      const cv::Mat& frameBgr, const std::optional<cv::Rect2f>& faceBox,
      const DetectorParams& params) = 0;
};
