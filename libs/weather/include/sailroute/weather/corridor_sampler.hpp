/**
 * @file corridor_sampler.hpp
 * @brief Forecast sampling at fixed spacing along a great-circle track.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sailroute/core/interfaces.hpp"

namespace sailroute::weather {

/**
 * @brief Successful forecast sample on the track.
 */
struct CorridorWeatherPoint {
  std::size_t sample_index{};
  sailroute::core::Coordinates coordinates{};
  sailroute::core::WindForecast forecast{};
  double distance_from_start_nm{};
};

/**
 * @brief Track samples and aggregates over the successful ones.
 *
 * Aggregates are zero when no sample succeeded.
 */
struct RouteCorridorWeather {
  sailroute::core::Coordinates start{};
  sailroute::core::Coordinates end{};
  std::vector<CorridorWeatherPoint> weather_points{};
  std::size_t samples_requested{};
  double average_wind_speed_kt{};
  double max_wind_speed_kt{};
  double average_wave_height_m{};
  double max_wave_height_m{};
  sailroute::core::Status status{sailroute::core::Status::Ok};
  std::string message{};
};

/**
 * @brief Queries a forecast provider at evenly spaced fractions of the track.
 */
class WeatherCorridorSampler {
 public:
  /**
   * @param provider Forecast source; must outlive the sampler.
   */
  explicit WeatherCorridorSampler(const sailroute::core::IForecastProvider& provider) : provider_(provider) {}

  /**
   * @brief Sample `ceil(distance / interval) + 1` points from `start` to `end`.
   *
   * Failed queries are skipped and logged. Points stay in sample-index order.
   * Intervals that need more than `kMaxCorridorSamples` samples are rejected.
   */
  [[nodiscard]] RouteCorridorWeather sample(const sailroute::core::Coordinates& start,
                                            const sailroute::core::Coordinates& end,
                                            double interval_nm) const;

 private:
  const sailroute::core::IForecastProvider& provider_;
};

/// Upper bound on forecast queries for one corridor.
inline constexpr std::size_t kMaxCorridorSamples = 10000;

/**
 * @brief Number of samples for a track: `ceil(distance / interval) + 1`.
 * @return 0 for a non-positive interval or when the count would exceed `kMaxCorridorSamples`.
 */
[[nodiscard]] std::size_t corridor_sample_count(double distance_nm, double interval_nm);

}  // namespace sailroute::weather
