#pragma once

#include <string>
#include <vector>

namespace chart {

enum class ChartStyle {
  CLASSIC,        // Fixed Snellen lines, "E" on top
  SINGLE_LETTER,  // One letter repeated, growing per line
  MIXED           // Rotating Sloan letters
};

/**
 * Parse a chart style name, case-insensitively. Accepts "classic snellen",
 * "classic", "single letter" and "single-letter"; any other name selects the
 * mixed Sloan chart.
 */
ChartStyle parseChartStyle(const std::string& name);

std::string toString(ChartStyle style);

/**
 * Build the optotype text of each chart line. Returns exactly one line per
 * denominator, top (largest) line first.
 *
 * @param style Chart style.
 * @param denominators Snellen denominators, one per line.
 * @param singleLetter Letter repeated by ChartStyle::SINGLE_LETTER.
 */
std::vector<std::string> buildLines(ChartStyle style,
                                    const std::vector<int>& denominators,
                                    char singleLetter = 'A');

}  // namespace chart
