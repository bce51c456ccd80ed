/**
 * @file test_corridor_sampler.cpp
 * @brief Route corridor weather sampling tests.
 * @author Watosn
 */

#include <cmath>
#include <string>

#include <spdlog/spdlog.h>

#include "sailroute/weather/corridor_sampler.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

// Wind grows eastward; the band around lon 0.5 has no data.
class GradientProvider final : public sailroute::core::IForecastProvider {
 public:
  sailroute::core::ForecastResult current_conditions(const sailroute::core::Coordinates& c) const override {
    ++calls;
    if (c.lon_deg > 0.4 && c.lon_deg < 0.6) {
      return sailroute::core::ForecastResult{.error = "outage", .status = sailroute::core::Status::DataUnavailable};
    }
    return sailroute::core::ForecastResult{.forecast = sailroute::core::WindForecast{
                                               .wind_speed_kt = 10.0 + 8.0 * c.lon_deg,
                                               .wind_direction_deg = 90.0,
                                               .wave_height_m = 4.0 * c.lon_deg}};
  }
  mutable int calls{};
};

// No forecast anywhere.
class OutageProvider final : public sailroute::core::IForecastProvider {
 public:
  sailroute::core::ForecastResult current_conditions(const sailroute::core::Coordinates&) const override {
    return sailroute::core::ForecastResult{.error = "offline", .status = sailroute::core::Status::DataUnavailable};
  }
};

}  // namespace

int main() {
  namespace weather = sailroute::weather;
  using sailroute::core::Coordinates;
  using sailroute::core::Status;

  if (weather::corridor_sample_count(100.0, 50.0) != 3U || weather::corridor_sample_count(101.0, 50.0) != 4U ||
      weather::corridor_sample_count(0.0, 50.0) != 1U || weather::corridor_sample_count(10.0, 0.0) != 0U ||
      weather::corridor_sample_count(9999.0, 1.0) != weather::kMaxCorridorSamples ||
      weather::corridor_sample_count(10000.0, 1.0) != 0U || weather::corridor_sample_count(60.0, 1e-12) != 0U) {
    spdlog::error("sample count mismatch");
    return 1;
  }

  GradientProvider provider;
  const weather::WeatherCorridorSampler sampler(provider);
  const Coordinates start{.lat_deg = 0.0, .lon_deg = 0.0};
  const Coordinates end{.lat_deg = 0.0, .lon_deg = 1.0};

  // 60.04 nm at 20 nm spacing: ceil(3.002) + 1 samples.
  const auto corridor = sampler.sample(start, end, 20.0);
  if (corridor.status != Status::Ok || corridor.samples_requested != 5U || provider.calls != 5) {
    spdlog::error("expected five sample queries, got {}", provider.calls);
    return 2;
  }
  if (corridor.weather_points.size() != 4U || corridor.weather_points[2].sample_index != 3U ||
      corridor.message != "1 of 5 corridor samples unavailable") {
    spdlog::error("failed sample must be skipped in order: '{}'", corridor.message);
    return 3;
  }
  if (!approx(corridor.average_wind_speed_kt, 14.0, 1e-6) || !approx(corridor.max_wind_speed_kt, 18.0, 1e-6) ||
      !approx(corridor.average_wave_height_m, 2.0, 1e-6) || !approx(corridor.max_wave_height_m, 4.0, 1e-6)) {
    spdlog::error("corridor aggregates mismatch: avg {} max {}", corridor.average_wind_speed_kt,
                  corridor.max_wind_speed_kt);
    return 4;
  }
  if (corridor.weather_points.front().distance_from_start_nm != 0.0 ||
      !approx(corridor.weather_points.back().distance_from_start_nm, 60.04, 0.01) ||
      !approx(corridor.weather_points.back().coordinates.lon_deg, 1.0, 1e-12)) {
    spdlog::error("corridor endpoints mismatch");
    return 5;
  }

  const auto same = sampler.sample(start, start, 20.0);
  if (same.samples_requested != 1U || same.weather_points.size() != 1U) {
    spdlog::error("zero-length corridor should sample once");
    return 6;
  }

  if (sampler.sample(start, end, 0.0).status != Status::InvalidInput ||
      sampler.sample(Coordinates{.lat_deg = 91.0}, end, 20.0).status != Status::InvalidInput) {
    spdlog::error("invalid corridor input must be rejected");
    return 7;
  }

  const auto dense = sampler.sample(start, end, 1e-12);
  if (dense.status != Status::InvalidInput || dense.samples_requested != 0U || !dense.weather_points.empty()) {
    spdlog::error("oversampled corridor must be rejected before querying");
    return 8;
  }

  OutageProvider outage;
  const auto empty = weather::WeatherCorridorSampler(outage).sample(start, end, 20.0);
  if (empty.status != Status::Ok || !empty.weather_points.empty() || empty.samples_requested != 5U ||
      empty.average_wind_speed_kt != 0.0 || empty.max_wind_speed_kt != 0.0 || empty.average_wave_height_m != 0.0 ||
      empty.max_wave_height_m != 0.0 || empty.message != "5 of 5 corridor samples unavailable") {
    spdlog::error("all-failed corridor must report zero aggregates: '{}'", empty.message);
    return 9;
  }

  return 0;
}
