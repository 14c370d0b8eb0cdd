#pragma once

#include <opencv2/objdetect.hpp>

#include "acuity_check/detector/landmark_strategy.hpp"

/**
 * Fallback strategy: Haar cascade eye classifier run only inside a face box
 * found by a higher-priority strategy. Produces exactly 2 eye centres sorted
 * by ascending x.
 */
class EyeCascadeDetector final : public LandmarkStrategy {
 public:
  static constexpr double SCALE_FACTOR{1.1};
  static constexpr int MIN_NEIGHBORS{4};
  static constexpr int MIN_EYE_SIZE_PX{20};

  /**
   * Reduce eye regions to a pair of eye centres. Keeps the 2 largest regions
   * by area and returns their centres sorted by ascending x.
   *
   * @param regions Eye regions, relative to the region of interest.
   * @param roiOrigin Top-left corner of the region of interest in the frame.
   * @return Eye centres in frame coordinates, or std::nullopt if there are
   * fewer than 2 regions.
   */
  static std::optional<std::vector<cv::Point2f>> eyeCentresFromRegions(
      std::vector<cv::Rect> regions, const cv::Point& roiOrigin);

  explicit EyeCascadeDetector(const std::string& cascadeFile);
  EyeCascadeDetector(const EyeCascadeDetector&) = delete;
  EyeCascadeDetector& operator=(const EyeCascadeDetector&) = delete;
  ~EyeCascadeDetector() override = default;

  std::string getName() const override { return "eye_cascade"; }
  bool isAvailable() const override { return loaded_; }
  std::optional<FaceLandmarks> detect(const cv::Mat& frameBgr,
                                      const std::optional<cv::Rect2f>& faceBox,
                                      const DetectorParams& params) override;

 private:
  cv::CascadeClassifier cascade_;
  bool loaded_{false};
};
