#include "acuity_check/detector/landmark_detector.hpp"

#include <spdlog/spdlog.h>

#include <opencv2/imgproc.hpp>

#include "acuity_check/detector/eye_cascade_detector.hpp"
#include "acuity_check/detector/face_landmark_detector.hpp"
#include "acuity_check/geometry/geometry.hpp"

std::optional<double> LandmarkDetector::Result::pixelIpd() const {
  if (!eyes) {
    return std::nullopt;
  }
  return geometry::pixelIpd(eyes->left, eyes->right);
}

LandmarkDetector::EyePair LandmarkDetector::makeEyePair(
    const std::vector<cv::Point2f>& points) {
  const auto& a{points[0]};
  const auto& b{points[1]};
  if (b.x < a.x) {
    return {b, a};
  }
  return {a, b};
}

void LandmarkDetector::drawDetections(cv::Mat& targetImage,
                                      const Result& result,
                                      cv::Scalar boxColor,
                                      cv::Scalar pointColor) {
  if (result.box) {
    cv::Rect box{static_cast<int>(result.box->x),
                 static_cast<int>(result.box->y),
                 static_cast<int>(result.box->width),
                 static_cast<int>(result.box->height)};
    cv::rectangle(targetImage, box, boxColor, 2);
  }
  if (result.landmarks) {
    for (const auto& point : *result.landmarks) {
      cv::circle(targetImage,
                 cv::Point(static_cast<int>(point.x),
                           static_cast<int>(point.y)),
                 2, pointColor, cv::FILLED);
    }
  }
}

LandmarkDetector::LandmarkDetector(const std::string& modelFile,
                                   const std::string& eyeCascadeFile) {
  strategies_.push_back(std::make_unique<FaceLandmarkDetector>(modelFile));
  strategies_.push_back(std::make_unique<EyeCascadeDetector>(eyeCascadeFile));
}

LandmarkDetector::LandmarkDetector(
    std::vector<std::unique_ptr<LandmarkStrategy>> strategies)
    : strategies_{std::move(strategies)} {}

LandmarkDetector::Result LandmarkDetector::detect(
    const cv::Mat& frameBgr, const DetectorParams& params) {
  Result result;
  if (frameBgr.empty()) {
    spdlog::warn("Cannot detect landmarks in an empty frame");
    return result;
  }

  for (const auto& strategy : strategies_) {
    if (!strategy->isAvailable()) {
      spdlog::debug("Skipping unavailable strategy: {}", strategy->getName());
      continue;
    }

    auto landmarksOpt{strategy->detect(frameBgr, result.box, params)};
    if (!landmarksOpt) {
      continue;
    }

    if (!result.box && landmarksOpt->box) {
      result.box = landmarksOpt->box;
    }

    if (landmarksOpt->points.size() >= 2) {
      result.eyes = makeEyePair(landmarksOpt->points);
      result.landmarks = std::move(landmarksOpt->points);
      result.source = strategy->getName();
      spdlog::debug("Eyes located by strategy: {}", result.source);
      return result;
    }
  }

  spdlog::warn("Could not locate both eyes in frame");
  return result;
}

bool LandmarkDetector::isPrimaryAvailable() const {
  return !strategies_.empty() && strategies_.front()->isAvailable();
}
