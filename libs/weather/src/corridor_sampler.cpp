/**
 * @file corridor_sampler.cpp
 * @brief Corridor sampling implementation.
 * @author Watosn
 */

#include "sailroute/weather/corridor_sampler.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "sailroute/geo/geo_math.hpp"

namespace sailroute::weather {

using sailroute::core::Status;

std::size_t corridor_sample_count(double distance_nm, double interval_nm) {
  if (!(interval_nm > 0.0) || !std::isfinite(interval_nm) || !std::isfinite(distance_nm)) {
    return 0U;
  }
  const double steps = std::ceil(std::max(distance_nm, 0.0) / interval_nm);
  if (!(steps < static_cast<double>(kMaxCorridorSamples))) {
    return 0U;
  }
  return static_cast<std::size_t>(steps) + 1U;
}

RouteCorridorWeather WeatherCorridorSampler::sample(const sailroute::core::Coordinates& start,
                                                    const sailroute::core::Coordinates& end,
                                                    double interval_nm) const {
  RouteCorridorWeather out{.start = start, .end = end};
  if (!sailroute::geo::is_valid(start) || !sailroute::geo::is_valid(end)) {
    out.status = Status::InvalidInput;
    out.message = "Invalid corridor coordinates";
    return out;
  }
  if (!std::isfinite(interval_nm) || interval_nm <= 0.0) {
    out.status = Status::InvalidInput;
    out.message = "Sampling interval must be positive";
    return out;
  }

  const double total_nm = sailroute::geo::distance_nm(start, end);
  const std::size_t n = corridor_sample_count(total_nm, interval_nm);
  if (n == 0U) {
    out.status = Status::InvalidInput;
    out.message = fmt::format("Sampling interval of {} nm needs more than {} samples over {:.1f} nm", interval_nm,
                              kMaxCorridorSamples, total_nm);
    return out;
  }
  out.samples_requested = n;
  out.weather_points.reserve(n);

  double wind_sum = 0.0;
  double wave_sum = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double fraction = n > 1U ? static_cast<double>(i) / static_cast<double>(n - 1U) : 0.0;
    const auto at = sailroute::geo::intermediate_point(start, end, fraction);
    const auto result = provider_.current_conditions(at);
    if (!result.forecast || result.status != Status::Ok) {
      spdlog::warn("corridor sample {} at ({:.4f}, {:.4f}) skipped: {}", i, at.lat_deg, at.lon_deg,
                   result.error.empty() ? "no forecast" : result.error);
      continue;
    }
    const auto& f = *result.forecast;
    out.weather_points.push_back(
        CorridorWeatherPoint{.sample_index = i, .coordinates = at, .forecast = f, .distance_from_start_nm = total_nm * fraction});
    wind_sum += f.wind_speed_kt;
    wave_sum += f.wave_height_m;
    out.max_wind_speed_kt = std::max(out.max_wind_speed_kt, f.wind_speed_kt);
    out.max_wave_height_m = std::max(out.max_wave_height_m, f.wave_height_m);
  }

  if (!out.weather_points.empty()) {
    const auto count = static_cast<double>(out.weather_points.size());
    out.average_wind_speed_kt = wind_sum / count;
    out.average_wave_height_m = wave_sum / count;
  }
  if (out.weather_points.size() < n) {
    out.message = fmt::format("{} of {} corridor samples unavailable", n - out.weather_points.size(), n);
  }
  return out;
}

}  // namespace sailroute::weather
