#include "acuity_check/detector/face_landmark_detector.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace {

constexpr int NUM_KEYPOINTS{5};
constexpr int SCORE_COL{14};

// Unreadable or malformed paths count as missing
bool modelFileExists(const std::string& modelFile) {
  std::error_code ec;
  bool exists{std::filesystem::exists(modelFile, ec)};
  if (ec) {
    spdlog::debug("Could not check model path {}: {}", modelFile,
                  ec.message());
    return false;
  }
  return exists;
}

}  // namespace

std::optional<FaceLandmarks> FaceLandmarkDetector::selectBestFace(
    const cv::Mat& faces) {
  if (faces.empty() || faces.cols < RESULT_ROW_SIZE) {
    return std::nullopt;
  }

  cv::Mat rows;
  faces.convertTo(rows, CV_32F);

  int bestIdx{0};
  for (int i = 1; i < rows.rows; ++i) {
    if (rows.at<float>(i, SCORE_COL) > rows.at<float>(bestIdx, SCORE_COL)) {
      bestIdx = i;
    }
  }

  const float* row{rows.ptr<float>(bestIdx)};
  FaceLandmarks result;
  result.box = cv::Rect2f{row[0], row[1], row[2], row[3]};
  for (int k = 0; k < NUM_KEYPOINTS; ++k) {
    result.points.emplace_back(row[4 + 2 * k], row[5 + 2 * k]);
  }
  return result;
}

FaceLandmarkDetector::FaceLandmarkDetector(const std::string& modelFile)
    : modelFile_{modelFile} {
  if (!modelFileExists(modelFile_)) {
    spdlog::warn("Face detection model not found at path: {}", modelFile_);
  }
}

bool FaceLandmarkDetector::isAvailable() const {
  return !loadFailed_ && modelFileExists(modelFile_);
}

bool FaceLandmarkDetector::loadModel(const cv::Size& inputSize,
                                     const DetectorParams& params) {
  spdlog::info("Loading face detection model at path: {}", modelFile_);
  try {
    model_ = cv::FaceDetectorYN::create(modelFile_, "", inputSize,
                                        params.scoreThreshold,
                                        params.nmsThreshold, params.topK);
  } catch (const cv::Exception& e) {
    spdlog::warn("Could not load face detection model: {}", e.what());
    model_.release();
  }

  if (!model_) {
    loadFailed_ = true;
    return false;
  }
  return true;
}

std::optional<FaceLandmarks> FaceLandmarkDetector::detect(
    const cv::Mat& frameBgr, const std::optional<cv::Rect2f>& /*faceBox*/,
    const DetectorParams& params) {
  if (!isAvailable()) {
    return std::nullopt;
  }
  if (frameBgr.empty() || frameBgr.type() != CV_8UC3) {
    spdlog::warn("Face detection requires a non-empty 3-channel frame");
    return std::nullopt;
  }

  if (!model_ && !loadModel(frameBgr.size(), params)) {
    return std::nullopt;
  }

  cv::Mat faces;
  try {
    model_->setInputSize(frameBgr.size());
    model_->setScoreThreshold(params.scoreThreshold);
    model_->setNMSThreshold(params.nmsThreshold);
    model_->setTopK(params.topK);
    model_->detect(frameBgr, faces);
  } catch (const cv::Exception& e) {
    spdlog::warn("Face detection failed: {}", e.what());
    return std::nullopt;
  }

  auto resultOpt{selectBestFace(faces)};
  if (!resultOpt) {
    spdlog::debug("No face found above score threshold {}",
                  params.scoreThreshold);
  }
  return resultOpt;
}
