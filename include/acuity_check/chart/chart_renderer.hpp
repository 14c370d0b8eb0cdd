#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "acuity_check/common_types.hpp"

namespace chart {

// Rows taller than this (or not finite) are rendered as a label only
inline constexpr double MAX_LETTER_HEIGHT_PX{2000.0};

enum class Polarity { DARK_ON_LIGHT, LIGHT_ON_DARK };

/**
 * Parse a polarity name, case-insensitively ("dark on light",
 * "dark_on_light", "light on dark", "light_on_dark"). Unknown names select
 * DARK_ON_LIGHT.
 */
Polarity parsePolarity(const std::string& name);

struct RenderOptions {
  Polarity polarity{Polarity::DARK_ON_LIGHT};
  // Extra space between letters, as a fraction of the letter height
  double letterSpacingEm{0.05};
  bool showLabels{true};
};

/**
 * Render chart rows to a BGR image. Each letter's cap height matches the
 * row's pixel height. Rows labelled 6/12 and 6/9 are followed by green and
 * red guide bars respectively. Letters of rows under 1 px or over
 * MAX_LETTER_HEIGHT_PX are not drawn.
 *
 * @param rows Chart rows, top first.
 * @param options Colors, spacing and label visibility.
 * @return Rendered chart (CV_8UC3).
 */
cv::Mat renderChart(const std::vector<ChartRow>& rows,
                    const RenderOptions& options = {});

}  // namespace chart
