/**
 * @file test_polar_csv.cpp
 * @brief Custom polar CSV loading tests.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

#include <spdlog/spdlog.h>

#include "sailroute/polar/polar_csv.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

constexpr const char* kPolar =
    "# custom boat\n"
    "config,tws,twa,speed,vmg\n"
    "Main + Jib,12,90,8.0,0.0\n"
    "Main + Jib,8,60,6.0,3.0\n"
    "Main + Jib,8,90,6.5,0.0\n"
    "Main + Jib,12,60,7.5\n"
    "\n"
    "Code Zero,8,90,7.0,\n";

}  // namespace

int main() {
  namespace polar = sailroute::polar;
  using sailroute::core::Status;

  const auto loaded = polar::parse_polar_csv(kPolar, "custom");
  if (loaded.status != Status::Ok || loaded.diagram.name != "custom" || loaded.diagram.polar_data.size() != 2U) {
    spdlog::error("csv parse failed: {}", loaded.message);
    return 1;
  }
  const auto& jib = loaded.diagram.polar_data.front();
  if (jib.sail_config != "Main + Jib" || jib.curves.size() != 2U || jib.curves.front().tws_kt != 8.0 ||
      jib.wind_min_kt != 8.0 || jib.wind_max_kt != 12.0 || jib.curves.front().points.front().twa_deg != 60.0) {
    spdlog::error("curves not sorted or wind range not derived");
    return 2;
  }
  // Missing VMG column is derived from speed and angle.
  const auto& derived = jib.curves.back().points.front();
  if (!approx(derived.vmg_kt, 7.5 * 0.5, 1e-9)) {
    spdlog::error("derived vmg mismatch: {}", derived.vmg_kt);
    return 3;
  }
  if (!approx(polar::speed(loaded.diagram, 10.0, 90.0, "Main + Jib"), 7.25, 1e-12)) {
    spdlog::error("loaded polar interpolation mismatch");
    return 4;
  }

  const auto bad_twa = polar::parse_polar_csv("Main + Jib,10,190,6.0\n");
  if (bad_twa.status != Status::InvalidInput || bad_twa.message.find("line 1") == std::string::npos) {
    spdlog::error("out of range TWA must be rejected with its line: {}", bad_twa.message);
    return 5;
  }
  const auto bad_speed = polar::parse_polar_csv("config,tws,twa,speed\nMain + Jib,10,90,-1\n");
  if (bad_speed.status != Status::InvalidInput || bad_speed.message.find("line 2") == std::string::npos) {
    spdlog::error("negative speed must be rejected with its line: {}", bad_speed.message);
    return 6;
  }
  if (polar::parse_polar_csv("Main + Jib,10,90\n").status != Status::InvalidInput ||
      polar::parse_polar_csv("# nothing\n").status != Status::InvalidInput) {
    spdlog::error("short rows and empty files must be rejected");
    return 7;
  }
  if (polar::parse_polar_csv("Main + Jib,10,90,6\nMain + Jib,10,90,6.2\n").status != Status::InvalidInput) {
    spdlog::error("duplicate TWA must be rejected");
    return 8;
  }

  namespace fs = std::filesystem;
  const auto path = fs::temp_directory_path() / "sailroute_polar_test.csv";
  {
    std::ofstream out(path);
    if (!out) {
      spdlog::error("failed to write csv");
      return 10;
    }
    out << kPolar;
  }
  const auto from_file = polar::load_polar_csv(path);
  if (from_file.status != Status::Ok || from_file.diagram.name != "sailroute_polar_test") {
    spdlog::error("file load failed: {}", from_file.message);
    return 9;
  }
  std::error_code ec;
  fs::remove(path, ec);

  if (polar::load_polar_csv(fs::temp_directory_path() / "sailroute_missing_polar.csv").status != Status::DataUnavailable) {
    spdlog::error("missing file must report DataUnavailable");
    return 11;
  }

  return 0;
}
