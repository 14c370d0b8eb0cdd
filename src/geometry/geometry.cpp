#include "acuity_check/geometry/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace {

constexpr double RAD_TO_DEG{180.0 / CV_PI};

double angleDeg(double extentPx, double focalLengthPx) {
  return 2.0 * std::atan((extentPx / 2.0) / focalLengthPx) * RAD_TO_DEG;
}

}  // namespace

double geometry::focalLengthPx(double pixelIpd, double knownDistanceMm,
                               double assumedIpdMm) {
  return (pixelIpd * knownDistanceMm) / assumedIpdMm;
}

DistanceEstimate geometry::computeDistanceMm(double pixelIpd,
                                             double assumedIpdMm,
                                             double focalLengthPx,
                                             double offsetMm) {
  double cameraToEye{(assumedIpdMm * focalLengthPx) /
                     std::max(PIXEL_IPD_EPSILON, pixelIpd)};
  double eyeToScreen{std::max(0.0, cameraToEye - std::max(0.0, offsetMm))};
  return {cameraToEye, eyeToScreen};
}

FieldOfView geometry::fieldOfView(double focalLengthPx, int widthPx,
                                  int heightPx) {
  double w{static_cast<double>(widthPx)};
  double h{static_cast<double>(heightPx)};
  return {angleDeg(w, focalLengthPx), angleDeg(h, focalLengthPx),
          angleDeg(std::hypot(w, h), focalLengthPx)};
}

double geometry::pixelIpd(const cv::Point2f& leftEye,
                          const cv::Point2f& rightEye) {
  return std::hypot(static_cast<double>(leftEye.x) - rightEye.x,
                    static_cast<double>(leftEye.y) - rightEye.y);
}

double geometry::pixelsPerMmFromCardWidth(double cardWidthPx) {
  return cardWidthPx / CARD_WIDTH_MM;
}

double geometry::cardHeightPx(double cardWidthPx) {
  return cardWidthPx * (CARD_HEIGHT_MM / CARD_WIDTH_MM);
}
