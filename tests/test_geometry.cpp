#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>

#include "acuity_check/geometry/geometry.hpp"

namespace {

bool near(double a, double b, double tol = 1e-9) {
  return std::fabs(a - b) <= tol;
}

}  // namespace

int main() {
  std::cout << "=== Testing geometry ===" << std::endl;

  std::cout << "\n[Test 1] Focal length calibration..." << std::endl;
  double f{geometry::focalLengthPx(100.0, 500.0, 63.0)};
  assert(near(f, 100.0 * 500.0 / 63.0) && "f = X * D / I");
  std::cout << "  ✓ f = " << f << " px" << std::endl;

  std::cout << "\n[Test 2] Calibration round trip..." << std::endl;
  for (double x : {12.5, 80.0, 143.7, 310.0}) {
    for (double d : {200.0, 500.0, 1999.0}) {
      for (double i : {40.0, 63.0, 80.0}) {
        double focal{geometry::focalLengthPx(x, d, i)};
        DistanceEstimate estimate{geometry::computeDistanceMm(x, i, focal, 0.0)};
        assert(near(estimate.cameraToEyeMm, d, 1e-6) &&
               "Camera-to-eye distance should equal the known distance");
        assert(near(estimate.eyeToScreenMm, d, 1e-6) &&
               "Zero offset leaves the distance unchanged");
      }
    }
  }
  std::cout << "  ✓ Known distance recovered for all inputs" << std::endl;

  std::cout << "\n[Test 3] Offset subtraction and clamping..." << std::endl;
  DistanceEstimate withOffset{geometry::computeDistanceMm(100.0, 63.0, f, 40.0)};
  assert(near(withOffset.cameraToEyeMm, 500.0, 1e-6));
  assert(near(withOffset.eyeToScreenMm, 460.0, 1e-6));
  DistanceEstimate hugeOffset{
      geometry::computeDistanceMm(100.0, 63.0, f, 10000.0)};
  assert(hugeOffset.eyeToScreenMm == 0.0 && "Distance is clamped at zero");
  DistanceEstimate negativeOffset{
      geometry::computeDistanceMm(100.0, 63.0, f, -25.0)};
  assert(near(negativeOffset.eyeToScreenMm, negativeOffset.cameraToEyeMm) &&
         "Negative offsets are treated as zero");
  for (double offset : {0.0, 10.0, 75.0, 150.0}) {
    for (double x : {5.0, 50.0, 500.0}) {
      DistanceEstimate e{geometry::computeDistanceMm(x, 63.0, f, offset)};
      assert(e.eyeToScreenMm >= 0.0);
      assert(near(e.eyeToScreenMm, std::max(0.0, e.cameraToEyeMm - offset)));
    }
  }
  std::cout << "  ✓ eye-to-screen = max(0, camera-to-eye - offset)"
            << std::endl;

  std::cout << "\n[Test 4] Zero pixel IPD stays finite..." << std::endl;
  DistanceEstimate zeroIpd{geometry::computeDistanceMm(0.0, 63.0, f, 40.0)};
  assert(std::isfinite(zeroIpd.cameraToEyeMm) && "Epsilon floor applies");
  assert(near(zeroIpd.cameraToEyeMm, 63.0 * f / geometry::PIXEL_IPD_EPSILON,
              1e-3));
  std::cout << "  ✓ camera-to-eye = " << zeroIpd.cameraToEyeMm << " mm"
            << std::endl;

  std::cout << "\n[Test 5] Field of view..." << std::endl;
  FieldOfView fov{geometry::fieldOfView(320.0, 640, 480)};
  assert(near(fov.horizontalDeg, 90.0, 1e-9));
  assert(near(fov.verticalDeg, 2.0 * std::atan(240.0 / 320.0) * 180.0 / CV_PI,
              1e-9));
  assert(near(fov.diagonalDeg, 2.0 * std::atan(400.0 / 320.0) * 180.0 / CV_PI,
              1e-9));
  assert(fov.diagonalDeg > fov.horizontalDeg && fov.horizontalDeg > fov.verticalDeg);
  std::cout << "  ✓ " << fov.horizontalDeg << " x " << fov.verticalDeg
            << " (diag " << fov.diagonalDeg << ")" << std::endl;

  std::cout << "\n[Test 6] Pixel IPD..." << std::endl;
  assert(near(geometry::pixelIpd({0.0f, 0.0f}, {3.0f, 4.0f}), 5.0));
  assert(near(geometry::pixelIpd({3.0f, 4.0f}, {0.0f, 0.0f}), 5.0));
  std::cout << "  ✓ Euclidean distance between eye centres" << std::endl;

  std::cout << "\n[Test 7] Screen scale from card..." << std::endl;
  assert(near(geometry::pixelsPerMmFromCardWidth(85.6), 1.0));
  assert(near(geometry::pixelsPerMmFromCardWidth(220.0), 220.0 / 85.6));
  assert(near(geometry::cardHeightPx(85.6), 53.98, 1e-9));
  std::cout << "  ✓ ID-1 card scale" << std::endl;

  std::cout << "\n=== All tests passed! ===" << std::endl;
  return 0;
}
