#pragma once

#include <string>

struct ChartRow {
  // Acuity label, e.g. "6/12"
  std::string label;
  // Letter height in screen pixels
  double pixelHeight;
  // Optotypes shown on the row
  std::string text;
};

struct FieldOfView {
  double horizontalDeg;
  double verticalDeg;
  double diagonalDeg;
};

struct DistanceEstimate {
  double cameraToEyeMm;
  double eyeToScreenMm;
};
