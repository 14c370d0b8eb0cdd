#include "acuity_check/chart/optotype.hpp"

#include <fmt/core.h>

double optotype::letterHeightMm(double distanceMm, double denominator) {
  return distanceMm * FIVE_ARCMIN_RATIO * (denominator / 6.0);
}

double optotype::letterSizePx(double letterHeightMm, double pixelsPerMm) {
  return letterHeightMm * pixelsPerMm;
}

std::vector<ChartRow> optotype::buildRows(double distanceMm,
                                          double pixelsPerMm,
                                          const std::vector<int>& denominators) {
  std::vector<ChartRow> rows;
  rows.reserve(denominators.size());
  for (int denominator : denominators) {
    double heightMm{letterHeightMm(distanceMm, denominator)};
    rows.push_back({fmt::format("6/{}", denominator),
                    letterSizePx(heightMm, pixelsPerMm), ""});
  }
  return rows;
}
