#include "acuity_check/chart/chart_renderer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <opencv2/imgproc.hpp>

namespace {

constexpr int FONT_FACE{cv::FONT_HERSHEY_SIMPLEX};
constexpr int MIN_CANVAS_WIDTH{720};
constexpr int PADDING{20};
constexpr int ROW_MARGIN{26};
constexpr int LABEL_GUTTER{64};
constexpr int LABEL_GAP{12};
constexpr double LABEL_HEIGHT_PX{15.0};
constexpr int BAR_HEIGHT{6};
constexpr int BAR_MARGIN_TOP{18};
constexpr int BAR_MARGIN_BOTTOM{4};

struct Palette {
  cv::Scalar foreground;
  cv::Scalar label;
  cv::Scalar background;
};

cv::Scalar hexToBgr(std::uint32_t rgb) {
  return {static_cast<double>(rgb & 0xFF),
          static_cast<double>((rgb >> 8) & 0xFF),
          static_cast<double>((rgb >> 16) & 0xFF)};
}

Palette getPalette(chart::Polarity polarity) {
  if (polarity == chart::Polarity::LIGHT_ON_DARK) {
    return {hexToBgr(0xf4f6fa), hexToBgr(0xb8c4d1), hexToBgr(0x0b2733)};
  }
  return {hexToBgr(0x1f2430), hexToBgr(0x9aa3ad), hexToBgr(0xffffff)};
}

// Cap height of the font at scale 1.0
double unitCapHeight() {
  int baseline{0};
  return cv::getTextSize("E", FONT_FACE, 1.0, 1, &baseline).height;
}

struct RowLayout {
  double fontScale{0.0};
  int thickness{1};
  int spacing{0};
  int width{0};
  int height{0};
};

bool isDrawable(double pixelHeight) {
  return std::isfinite(pixelHeight) && pixelHeight >= 1.0 &&
         pixelHeight <= chart::MAX_LETTER_HEIGHT_PX;
}

RowLayout layoutRow(const ChartRow& row, double letterSpacingEm) {
  RowLayout layout;
  if (!isDrawable(row.pixelHeight) || row.text.empty()) {
    // Only the label is drawn
    return layout;
  }
  layout.height = static_cast<int>(std::ceil(row.pixelHeight));

  layout.fontScale = row.pixelHeight / unitCapHeight();
  layout.thickness = std::max(1, cvRound(row.pixelHeight / 8.0));
  layout.spacing = cvRound(row.pixelHeight * letterSpacingEm);
  for (char ch : row.text) {
    int baseline{0};
    cv::Size size{cv::getTextSize(std::string(1, ch), FONT_FACE,
                                  layout.fontScale, layout.thickness,
                                  &baseline)};
    layout.width += size.width;
  }
  layout.width += layout.spacing * static_cast<int>(row.text.size() - 1);
  return layout;
}

}  // namespace

chart::Polarity chart::parsePolarity(const std::string& name) {
  std::string lower{name};
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  std::replace(lower.begin(), lower.end(), '_', ' ');
  if (lower == "light on dark") {
    return Polarity::LIGHT_ON_DARK;
  }
  return Polarity::DARK_ON_LIGHT;
}

cv::Mat chart::renderChart(const std::vector<ChartRow>& rows,
                           const RenderOptions& options) {
  Palette palette{getPalette(options.polarity)};
  double labelScale{LABEL_HEIGHT_PX / unitCapHeight()};
  int labelHeight{static_cast<int>(LABEL_HEIGHT_PX)};

  std::vector<RowLayout> layouts;
  int maxRowWidth{0};
  int canvasHeight{2 * PADDING};
  for (const auto& row : rows) {
    RowLayout layout{layoutRow(row, options.letterSpacingEm)};
    maxRowWidth = std::max(maxRowWidth, layout.width);
    canvasHeight += std::max(layout.height, labelHeight) + 2 * ROW_MARGIN;
    if (row.label == "6/12" || row.label == "6/9") {
      canvasHeight += BAR_MARGIN_TOP + BAR_HEIGHT + BAR_MARGIN_BOTTOM;
    }
    layouts.push_back(layout);
  }

  int lettersLeft{PADDING + LABEL_GUTTER + LABEL_GAP};
  int canvasWidth{
      std::max(MIN_CANVAS_WIDTH, lettersLeft + maxRowWidth + PADDING)};
  int blockWidth{canvasWidth - lettersLeft - PADDING};
  cv::Mat canvas(canvasHeight, canvasWidth, CV_8UC3, palette.background);

  int y{PADDING};
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const auto& row{rows[i]};
    const auto& layout{layouts[i]};
    int rowHeight{std::max(layout.height, labelHeight)};
    y += ROW_MARGIN;
    // Text is drawn from its baseline
    int baselineY{y + (rowHeight + layout.height) / 2};

    if (options.showLabels) {
      int baseline{0};
      cv::Size labelSize{
          cv::getTextSize(row.label, FONT_FACE, labelScale, 1, &baseline)};
      cv::putText(canvas, row.label,
                  cv::Point(PADDING + LABEL_GUTTER - labelSize.width,
                            y + (rowHeight + labelHeight) / 2),
                  FONT_FACE, labelScale, palette.label, 1, cv::LINE_AA);
    }

    if (layout.fontScale > 0.0) {
      int x{lettersLeft + (blockWidth - layout.width) / 2};
      for (char ch : row.text) {
        std::string letter(1, ch);
        int baseline{0};
        cv::Size size{cv::getTextSize(letter, FONT_FACE, layout.fontScale,
                                      layout.thickness, &baseline)};
        cv::putText(canvas, letter, cv::Point(x, baselineY), FONT_FACE,
                    layout.fontScale, palette.foreground, layout.thickness,
                    cv::LINE_AA);
        x += size.width + layout.spacing;
      }
    } else if (!row.text.empty() && !(row.pixelHeight < 1.0)) {
      spdlog::warn("Row {} is {:.0f} px tall, above the {:.0f} px limit; "
                   "letters not drawn",
                   row.label, row.pixelHeight, MAX_LETTER_HEIGHT_PX);
    } else if (!row.text.empty()) {
      spdlog::debug("Row {} is smaller than a pixel; letters not drawn",
                    row.label);
    }

    y += rowHeight + ROW_MARGIN;

    if (row.label == "6/12" || row.label == "6/9") {
      cv::Scalar barColor{row.label == "6/12" ? hexToBgr(0x2ecc71)
                                              : hexToBgr(0xe74c3c)};
      y += BAR_MARGIN_TOP;
      cv::rectangle(canvas, cv::Rect(lettersLeft, y, blockWidth, BAR_HEIGHT),
                    barColor, cv::FILLED);
      y += BAR_HEIGHT + BAR_MARGIN_BOTTOM;
    }
  }

  return canvas;
}
