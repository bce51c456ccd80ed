/**
 * @file polar_cli.cpp
 * @brief Polar lookup CLI: target speed, optimal VMG and sail advice at one wind.
 * @author Watosn
 */

#include <array>
#include <cstdlib>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "sailroute/polar/lagoon440.hpp"
#include "sailroute/polar/polar_csv.hpp"
#include "sailroute/polar/sail_advisor.hpp"

int main(int argc, char** argv) {
  if (argc < 3 || argc > 6) {
    spdlog::error("usage: polar_cli <tws_kt> <twa_deg> [sail_config] [polar_csv] [actual_speed_kt]");
    spdlog::error("sail_config: e.g. \"Main + Jib\" (default: first configuration)");
    return 1;
  }

  const double tws = std::atof(argv[1]);
  const double twa = std::atof(argv[2]);
  const std::string sail_config = (argc >= 4) ? argv[3] : "";
  const std::string polar_csv = (argc >= 5) ? argv[4] : "";

  sailroute::polar::PolarDiagram polar = sailroute::polar::lagoon440();
  if (!polar_csv.empty()) {
    auto loaded = sailroute::polar::load_polar_csv(polar_csv);
    if (loaded.status != sailroute::core::Status::Ok) {
      spdlog::error("polar load failed: {}", loaded.message);
      return 2;
    }
    polar = std::move(loaded.diagram);
  }

  const auto sample = sailroute::polar::evaluate(polar, tws, twa, sail_config);
  if (sample.status != sailroute::core::Status::Ok) {
    spdlog::error("polar evaluation failed: status={}", static_cast<int>(sample.status));
    return 3;
  }
  fmt::print("polar={} config={} tws_kt={} twa_deg={} speed_kt={:.2f} vmg_kt={:.2f}\n", polar.name, sample.sail_config,
             tws, sailroute::polar::normalize_twa(twa), sample.speed_kt, sample.vmg_kt);

  const sailroute::polar::SailConfigAdvisor advisor(polar);
  const auto best = advisor.optimal_angles(tws, sail_config);
  fmt::print("upwind twa={:.0f} speed_kt={:.2f} vmg_kt={:.2f}\n", best.upwind.twa_deg, best.upwind.speed_kt,
             best.upwind.vmg_kt);
  fmt::print("downwind twa={:.0f} speed_kt={:.2f} vmg_kt={:.2f}\n", best.downwind.twa_deg, best.downwind.speed_kt,
             best.downwind.vmg_kt);

  constexpr std::array<std::pair<sailroute::core::SailingMode, const char*>, 3> kModes{{
      {sailroute::core::SailingMode::Speed, "speed"},
      {sailroute::core::SailingMode::Comfort, "comfort"},
      {sailroute::core::SailingMode::Mixed, "mixed"},
  }};
  for (const auto& [mode, name] : kModes) {
    const auto rec = advisor.recommend(tws, twa, mode);
    if (rec.status != sailroute::core::Status::Ok) {
      spdlog::error("no recommendation for mode {}", name);
      return 4;
    }
    fmt::print("advice mode={} sails={} polar={} expected_kt={:.1f} x{:.2f} confidence={} \"{}\"\n", name,
               sailroute::core::sail_label(rec.configuration), rec.polar_config, rec.expected_speed_kt,
               rec.speed_multiplier, rec.confidence, rec.description);
  }

  if (argc >= 6) {
    const auto perf = sailroute::polar::performance(polar, tws, twa, std::atof(argv[5]), sail_config);
    if (perf.status != sailroute::core::Status::Ok) {
      spdlog::error("performance evaluation failed: status={}", static_cast<int>(perf.status));
      return 5;
    }
    fmt::print("performance target_kt={:.2f} actual_kt={:.2f} pct={:.1f} diff_kt={:+.2f}\n", perf.target_speed_kt,
               perf.actual_speed_kt, perf.performance_pct, perf.speed_difference_kt);
  }
  return 0;
}
