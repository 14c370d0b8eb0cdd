#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "acuity_check/calibration/calibration_session.hpp"
#include "acuity_check/chart/optotype.hpp"

namespace {

// Returns whatever eye positions the test scripts for the next snapshot
class ScriptedStrategy final : public LandmarkStrategy {
 public:
  std::string getName() const override { return "scripted"; }
  bool isAvailable() const override { return true; }

  std::optional<FaceLandmarks> detect(const cv::Mat&,
                                      const std::optional<cv::Rect2f>&,
                                      const DetectorParams&) override {
    return next;
  }

  void placeEyes(float separationPx) {
    next = FaceLandmarks{cv::Rect2f(200.0f, 100.0f, 240.0f, 260.0f),
                         {{320.0f + separationPx, 200.0f}, {320.0f, 200.0f}}};
  }

  std::optional<FaceLandmarks> next;
};

bool near(double a, double b, double tol = 1e-6) {
  return std::fabs(a - b) <= tol;
}

bool hasWarning(const CalibrationSession& session, const std::string& prefix) {
  auto warnings{session.getWarnings()};
  return std::any_of(warnings.begin(), warnings.end(),
                     [&prefix](const std::string& w) {
                       return w.rfind(prefix, 0) == 0;
                     });
}

}  // namespace

int main() {
  std::cout << "=== Testing calibration session ===" << std::endl;

  auto strategy{std::make_unique<ScriptedStrategy>()};
  ScriptedStrategy* eyes{strategy.get()};
  std::vector<std::unique_ptr<LandmarkStrategy>> strategies;
  strategies.push_back(std::move(strategy));
  auto detector{std::make_shared<LandmarkDetector>(std::move(strategies))};

  CalibrationSession session{detector};
  cv::Mat frame(480, 640, CV_8UC3, cv::Scalar::all(90));

  std::cout << "\n[Test 1] Initial state..." << std::endl;
  assert(session.getState() == CalibrationSession::State::UNCALIBRATED);
  assert(session.getCalibrationState().screenPixelsPerMm == 0.0);
  assert(!session.getCalibrationState().focalLengthPx);
  assert(session.getReadingDistanceMm() == optotype::DEFAULT_DISTANCE_MM);
  std::cout << "  ✓ " << toString(session.getState()) << std::endl;

  std::cout << "\n[Test 2] Calibrating before any snapshot..." << std::endl;
  assert(!session.calibrateFocalLength(500.0, 63.0));
  assert(hasWarning(session, "Take a snapshot first."));
  assert(session.getState() == CalibrationSession::State::UNCALIBRATED);
  assert(!session.getCalibrationState().focalLengthPx);
  std::cout << "  ✓ Rejected with a warning" << std::endl;

  std::cout << "\n[Test 3] Screen scale..." << std::endl;
  session.setScreenScale(-1.0);
  assert(session.getState() == CalibrationSession::State::UNCALIBRATED);
  session.setScreenScaleFromCard(85.6 * 4.0);
  assert(near(session.getCalibrationState().screenPixelsPerMm, 4.0));
  assert(session.getState() ==
         CalibrationSession::State::SCREEN_SCALE_KNOWN);
  std::cout << "  ✓ 4 px/mm" << std::endl;

  std::cout << "\n[Test 4] Snapshot before focal length..." << std::endl;
  eyes->placeEyes(100.0f);
  auto first{session.onSnapshot(frame)};
  assert(first.pixelIpd && near(*first.pixelIpd, 100.0));
  assert(!first.eyeToScreenMm && !first.fieldOfView);
  assert(hasWarning(session, "Not calibrated yet."));
  assert(session.getState() ==
         CalibrationSession::State::SCREEN_SCALE_KNOWN);
  std::cout << "  ✓ Pixel IPD stored, no distance yet" << std::endl;

  std::cout << "\n[Test 5] Focal length calibration..." << std::endl;
  auto focal{session.calibrateFocalLength(500.0, 63.0)};
  assert(focal && near(*focal, 100.0 * 500.0 / 63.0));
  assert(session.getState() == CalibrationSession::State::DISTANCE_KNOWN &&
         "Calibration re-estimates from the same snapshot in one step");
  assert(toString(CalibrationSession::State::FOCAL_LENGTH_KNOWN) ==
         "FOCAL_LENGTH_KNOWN");
  auto calibration{session.getCalibrationState()};
  assert(calibration.eyeToScreenMm && near(*calibration.eyeToScreenMm, 460.0));
  assert(near(session.getReadingDistanceMm(), 460.0));
  assert(session.getWarnings().empty());
  std::cout << "  ✓ f = " << *focal << " px" << std::endl;

  std::cout << "\n[Test 6] Measuring snapshot..." << std::endl;
  eyes->placeEyes(50.0f);
  auto measured{session.onSnapshot(frame)};
  assert(measured.eyeToScreenMm && near(*measured.eyeToScreenMm, 960.0));
  assert(measured.fieldOfView);
  assert(near(measured.fieldOfView->horizontalDeg,
              2.0 * std::atan(320.0 / *focal) * 180.0 / CV_PI));
  assert(near(session.getReadingDistanceMm(), 960.0));
  std::cout << "  ✓ Eye to screen: " << *measured.eyeToScreenMm << " mm"
            << std::endl;

  std::cout << "\n[Test 7] Changing distance settings..." << std::endl;
  session.setDistanceSettings({63.0, 0.0});
  assert(near(session.getReadingDistanceMm(), 1000.0));
  session.setDistanceSettings({63.0, 40.0});
  assert(near(session.getReadingDistanceMm(), 960.0));
  std::cout << "  ✓ Distance re-estimated" << std::endl;

  std::cout << "\n[Test 8] Chart rows from the session..." << std::endl;
  auto rows{session.buildChart(chart::ChartStyle::SINGLE_LETTER, 'E')};
  assert(rows.size() == optotype::CANONICAL_DENOMINATORS.size());
  assert(rows.front().label == "6/60" && rows.front().text == "EE");
  assert(near(rows.front().pixelHeight, 960.0 * 0.001454 * 10.0 * 4.0));
  assert(rows.back().label == "6/6");
  std::cout << "  ✓ Sized for 960 mm" << std::endl;

  std::cout << "\n[Test 9] Failed detection..." << std::endl;
  eyes->next.reset();
  auto failed{session.onSnapshot(frame)};
  assert(!failed.pixelIpd && !failed.eyeToScreenMm);
  assert(hasWarning(session, "Could not estimate eyes."));
  assert(!session.getLatestPixelIpd());
  calibration = session.getCalibrationState();
  assert(calibration.focalLengthPx && near(*calibration.focalLengthPx, *focal));
  assert(calibration.eyeToScreenMm && near(*calibration.eyeToScreenMm, 960.0));
  assert(session.getState() == CalibrationSession::State::DISTANCE_KNOWN);
  assert(!session.calibrateFocalLength(500.0, 63.0) &&
         "A failed snapshot cannot be calibrated against");
  std::cout << "  ✓ Focal length and last distance kept" << std::endl;

  std::cout << "\n[Test 10] Invalid calibration inputs..." << std::endl;
  eyes->placeEyes(80.0f);
  session.onSnapshot(frame);
  assert(!session.calibrateFocalLength(0.0, 63.0));
  assert(!session.calibrateFocalLength(500.0, -5.0));
  assert(near(*session.getCalibrationState().focalLengthPx, *focal));
  std::cout << "  ✓ Focal length unchanged" << std::endl;

  std::cout << "\n[Test 11] Reset..." << std::endl;
  session.reset();
  assert(session.getState() == CalibrationSession::State::UNCALIBRATED);
  assert(session.getCalibrationState().screenPixelsPerMm == 0.0);
  assert(!session.getCalibrationState().focalLengthPx);
  assert(!session.getLatestPixelIpd());
  assert(session.getReadingDistanceMm() == optotype::DEFAULT_DISTANCE_MM);
  std::cout << "  ✓ Back to " << toString(session.getState()) << std::endl;

  std::cout << "\n[Test 12] Calibrating without a screen scale..." << std::endl;
  eyes->placeEyes(63.0f);
  session.onSnapshot(frame);
  assert(session.calibrateFocalLength(1000.0, 63.0));
  assert(session.getState() == CalibrationSession::State::DISTANCE_KNOWN);
  assert(near(session.getReadingDistanceMm(), 960.0));
  std::cout << "  ✓ Distance known, screen scale still 0" << std::endl;

  std::cout << "\n[Test 13] Chart built while the scale changes..."
            << std::endl;
  {
    const double rowMm{960.0 * optotype::FIVE_ARCMIN_RATIO};
    constexpr int ITERATIONS{2000};
    std::thread writer{[&session]() {
      for (int i = 0; i < ITERATIONS; ++i) {
        session.setScreenScale(i % 2 == 0 ? 2.0 : 4.0);
      }
    }};
    for (int i = 0; i < ITERATIONS; ++i) {
      auto chartRows{session.buildChart(chart::ChartStyle::MIXED)};
      double smallest{chartRows.back().pixelHeight};
      assert((smallest == 0.0 || near(smallest, rowMm * 2.0) ||
              near(smallest, rowMm * 4.0)) &&
             "Rows sized with one screen scale");
      assert(near(chartRows.front().pixelHeight, smallest * 10.0));
    }
    writer.join();
    assert(near(session.getReadingDistanceMm(), 960.0));
    std::cout << "  ✓ Distance and scale read together" << std::endl;
  }

  std::cout << "\n=== All tests passed! ===" << std::endl;
  return 0;
}
