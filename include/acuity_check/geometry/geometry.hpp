#pragma once

#include <opencv2/core.hpp>

#include "acuity_check/common_types.hpp"

namespace geometry {

// Floor applied to the pixel IPD before dividing by it.
inline constexpr double PIXEL_IPD_EPSILON{1e-6};

/**
 * One-shot focal length calibration from a snapshot taken at a known
 * camera-to-eye distance. The caller must make sure pixelIpd and assumedIpdMm
 * are positive.
 *
 * @param pixelIpd Interpupillary distance measured in the image, in pixels.
 * @param knownDistanceMm Measured camera-to-eye distance, in mm.
 * @param assumedIpdMm Real interpupillary distance of the viewer, in mm.
 * @return Focal length in pixels.
 */
double focalLengthPx(double pixelIpd, double knownDistanceMm,
                     double assumedIpdMm);

/**
 * Estimate camera-to-eye and eye-to-screen distances with the pinhole model.
 * The pixel IPD is floored at PIXEL_IPD_EPSILON, and negative offsets are
 * treated as zero.
 *
 * @param pixelIpd Interpupillary distance measured in the image, in pixels.
 * @param assumedIpdMm Real interpupillary distance of the viewer, in mm.
 * @param focalLengthPx Calibrated focal length, in pixels.
 * @param offsetMm Distance between the camera and the screen plane, in mm.
 * @return {camera-to-eye, eye-to-screen (clamped at zero)} in mm.
 */
DistanceEstimate computeDistanceMm(double pixelIpd, double assumedIpdMm,
                                   double focalLengthPx, double offsetMm);

/**
 * Horizontal, vertical and diagonal field of view of a camera, in degrees.
 * A non-positive focal length yields meaningless values; guard before
 * display.
 */
FieldOfView fieldOfView(double focalLengthPx, int widthPx, int heightPx);

/**
 * Euclidean distance between two eye centres, in pixels.
 */
double pixelIpd(const cv::Point2f& leftEye, const cv::Point2f& rightEye);

// ISO/IEC 7810 ID-1 card (credit/debit card) dimensions
inline constexpr double CARD_WIDTH_MM{85.60};
inline constexpr double CARD_HEIGHT_MM{53.98};

/**
 * Screen scale from the on-screen width of a rectangle that was resized to
 * match a physical ID-1 card held against the display.
 *
 * @param cardWidthPx Width of the matched rectangle, in screen pixels.
 * @return Screen pixels per millimetre.
 */
double pixelsPerMmFromCardWidth(double cardWidthPx);

// Height of the card rectangle that keeps the ID-1 aspect ratio.
double cardHeightPx(double cardWidthPx);

}  // namespace geometry
