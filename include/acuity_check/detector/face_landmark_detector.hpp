#pragma once

#include <opencv2/objdetect.hpp>

#include "acuity_check/detector/landmark_strategy.hpp"

/**
 * Primary strategy: YuNet face detector (ONNX) run through
 * cv::FaceDetectorYN. Produces a face box and 5 keypoints (right eye, left
 * eye, nose tip, right mouth corner, left mouth corner).
 */
class FaceLandmarkDetector final : public LandmarkStrategy {
 public:
  // Floats per YuNet result row: box (4), 5 keypoints (10), score (1)
  static constexpr int RESULT_ROW_SIZE{15};

  /**
   * Pick the highest-scoring face from a YuNet result matrix.
   *
   * @param faces N x 15 CV_32F matrix returned by cv::FaceDetectorYN.
   * @return Box and 5 keypoints of the best face, or std::nullopt if there
   * are no rows.
   */
  static std::optional<FaceLandmarks> selectBestFace(const cv::Mat& faces);

  explicit FaceLandmarkDetector(const std::string& modelFile);
  FaceLandmarkDetector(const FaceLandmarkDetector&) = delete;
  FaceLandmarkDetector& operator=(const FaceLandmarkDetector&) = delete;
  ~FaceLandmarkDetector() override = default;

  std::string getName() const override { return "yunet"; }
  bool isAvailable() const override;
  std::optional<FaceLandmarks> detect(const cv::Mat& frameBgr,
                                      const std::optional<cv::Rect2f>& faceBox,
                                      const DetectorParams& params) override;

 private:
  bool loadModel(const cv::Size& inputSize, const DetectorParams& params);

  std::string modelFile_;
  cv::Ptr<cv::FaceDetectorYN> model_;
  bool loadFailed_{false};
};
