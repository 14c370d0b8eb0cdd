#include "acuity_check/detector/eye_cascade_detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <opencv2/imgproc.hpp>

std::optional<std::vector<cv::Point2f>>
EyeCascadeDetector::eyeCentresFromRegions(std::vector<cv::Rect> regions,
                                          const cv::Point& roiOrigin) {
  if (regions.size() < 2) {
    return std::nullopt;
  }

  std::stable_sort(
      regions.begin(), regions.end(),
      [](const cv::Rect& a, const cv::Rect& b) { return a.area() > b.area(); });

  std::vector<cv::Point2f> centres;
  for (std::size_t i = 0; i < 2; ++i) {
    const auto& r{regions[i]};
    centres.emplace_back(static_cast<float>(roiOrigin.x + r.x + r.width / 2.0),
                         static_cast<float>(roiOrigin.y + r.y + r.height / 2.0));
  }
  std::stable_sort(
      centres.begin(), centres.end(),
      [](const cv::Point2f& a, const cv::Point2f& b) { return a.x < b.x; });
  return centres;
}

EyeCascadeDetector::EyeCascadeDetector(const std::string& cascadeFile) {
  try {
    loaded_ = cascade_.load(cascadeFile);
  } catch (const cv::Exception& e) {
    spdlog::warn("Exception while loading eye cascade: {}", e.what());
    loaded_ = false;
  }

  if (!loaded_) {
    spdlog::warn("Eye cascade not available at path: {}", cascadeFile);
  }
}

std::optional<FaceLandmarks> EyeCascadeDetector::detect(
    const cv::Mat& frameBgr, const std::optional<cv::Rect2f>& faceBox,
    const DetectorParams& /*params*/) {
  if (!loaded_ || !faceBox || frameBgr.empty()) {
    return std::nullopt;
  }

  // Box coordinates are truncated to whole pixels, then clipped to the frame
  cv::Rect box{static_cast<int>(faceBox->x), static_cast<int>(faceBox->y),
               static_cast<int>(faceBox->width),
               static_cast<int>(faceBox->height)};
  cv::Rect roi{box & cv::Rect(0, 0, frameBgr.cols, frameBgr.rows)};
  if (roi.empty()) {
    spdlog::debug("Face box lies outside the frame; skipping eye cascade");
    return std::nullopt;
  }

  cv::Mat gray;
  if (frameBgr.channels() == 3) {
    cv::cvtColor(frameBgr, gray, cv::COLOR_BGR2GRAY);
  } else {
    gray = frameBgr;
  }

  std::vector<cv::Rect> eyes;
  try {
    cascade_.detectMultiScale(gray(roi), eyes, SCALE_FACTOR, MIN_NEIGHBORS, 0,
                              cv::Size(MIN_EYE_SIZE_PX, MIN_EYE_SIZE_PX));
  } catch (const cv::Exception& e) {
    spdlog::warn("Eye cascade detection failed: {}", e.what());
    return std::nullopt;
  }

  auto centresOpt{eyeCentresFromRegions(std::move(eyes), roi.tl())};
  if (!centresOpt) {
    spdlog::debug("Eye cascade found fewer than 2 eyes");
    return std::nullopt;
  }

  FaceLandmarks result;
  result.box = faceBox;
  result.points = std::move(*centresOpt);
  return result;
}
