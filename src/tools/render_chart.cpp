#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <opencv2/opencv.hpp>

#include "acuity_check/chart/chart_lines.hpp"
#include "acuity_check/chart/chart_renderer.hpp"
#include "acuity_check/chart/optotype.hpp"
#include "acuity_check/config/settings.hpp"
#include "acuity_check/geometry/geometry.hpp"

namespace {

// Longest viewing distance a chart is rendered for
constexpr double MAX_DISTANCE_MM{20000.0};

}  // namespace

int main(int argc, char* argv[]) {
  CLI::App app{"Render an acuity chart for a viewing distance"};

  std::string outputFile;
  std::string chartStyle{"mixed"};
  std::string singleLetter{"A"};
  std::string polarity{"dark_on_light"};
  std::string logLevel{"info"};
  double distanceMm{optotype::DEFAULT_DISTANCE_MM};
  double cardWidthPx{220.0};
  double pixelsPerMm{0.0};
  double letterSpacingEm{0.05};
  bool hideLabels{false};

  app.add_option("-o,--output_file", outputFile, "Chart image to write")
      ->required();
  app.add_option("-d,--distance_mm", distanceMm, "Eye to screen distance (mm)")
      ->check(CLI::Range(1.0, MAX_DISTANCE_MM));
  auto* cardOpt{app.add_option(
      "--card_width_px", cardWidthPx,
      "On-screen width (px) of a rectangle matched to an ID-1 card")};
  auto* ppmOpt{app.add_option("--pixels_per_mm", pixelsPerMm,
                              "Screen scale (px/mm)")
                   ->check(CLI::NonNegativeNumber)};
  cardOpt->excludes(ppmOpt);
  app.add_option("--style", chartStyle,
                 "Chart style: classic, single-letter or mixed");
  app.add_option("--letter", singleLetter, "Letter for the single-letter chart");
  app.add_option("--polarity", polarity, "dark_on_light or light_on_dark");
  app.add_option("--letter_spacing_em", letterSpacingEm, "Letter spacing (em)")
      ->check(CLI::Range(0.0, 0.2));
  app.add_flag("--hide_labels", hideLabels, "Hide the 6/x labels");
  app.add_option("--log_level", logLevel,
                 "Log level: trace, debug, info, warn, error")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));

  CLI11_PARSE(app, argc, argv);

  spdlog::set_level(spdlog::level::from_str(logLevel));

  if (!app.count("--pixels_per_mm")) {
    pixelsPerMm = geometry::pixelsPerMmFromCardWidth(cardWidthPx);
  }

  std::vector<int> denominators(optotype::CANONICAL_DENOMINATORS.begin(),
                                optotype::CANONICAL_DENOMINATORS.end());
  auto rows{optotype::buildRows(distanceMm, pixelsPerMm, denominators)};
  auto lines{chart::buildLines(chart::parseChartStyle(chartStyle),
                               denominators,
                               config::normalizeSingleLetter(singleLetter))};
  for (std::size_t i = 0; i < rows.size(); ++i) {
    rows[i].text = lines[i];
    fmt::print("{:>5}  {:8.2f} px  {}\n", rows[i].label, rows[i].pixelHeight,
               rows[i].text);
  }

  chart::RenderOptions options;
  options.polarity = chart::parsePolarity(polarity);
  options.letterSpacingEm = letterSpacingEm;
  options.showLabels = !hideLabels;

  cv::Mat chartImage;
  try {
    chartImage = chart::renderChart(rows, options);
  } catch (const cv::Exception& e) {
    spdlog::error("Could not render chart: {}", e.what());
    return -1;
  }
  if (!cv::imwrite(outputFile, chartImage)) {
    spdlog::error("Could not write chart to: {}", outputFile);
    return -1;
  }
  spdlog::info("Saved chart to: {}", outputFile);

  return 0;
}
