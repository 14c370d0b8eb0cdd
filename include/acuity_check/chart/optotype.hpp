#pragma once

#include <array>
#include <vector>

#include "acuity_check/common_types.hpp"

namespace optotype {

// Snellen denominators shown on every chart, largest letters first
inline constexpr std::array<int, 8> CANONICAL_DENOMINATORS{60, 48, 36, 24,
                                                           18, 12, 9,  6};

// Chart distance used until an eye-to-screen distance has been measured
inline constexpr double DEFAULT_DISTANCE_MM{3000.0};

// tan(5 arcmin): a 6/6 optotype subtends 5 arcmin at the viewing distance
inline constexpr double FIVE_ARCMIN_RATIO{0.001454};

/**
 * Physical optotype height for a Snellen denominator at a viewing distance.
 *
 * @param distanceMm Eye-to-chart distance, in mm.
 * @param denominator Snellen denominator (6 for 6/6).
 * @return Letter height in mm.
 */
double letterHeightMm(double distanceMm, double denominator);

/**
 * Optotype height converted to screen pixels.
 *
 * @param letterHeightMm Letter height, in mm.
 * @param pixelsPerMm Screen scale, in pixels per mm.
 */
double letterSizePx(double letterHeightMm, double pixelsPerMm);

/**
 * Label and pixel size for each denominator. Row text is left empty; fill it
 * from chart::buildLines.
 */
std::vector<ChartRow> buildRows(double distanceMm, double pixelsPerMm,
                                const std::vector<int>& denominators);

}  // namespace optotype
