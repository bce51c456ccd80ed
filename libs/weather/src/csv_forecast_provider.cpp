/**
 * @file csv_forecast_provider.cpp
 * @brief Gridded wind CSV provider implementation.
 * @author Watosn
 */

#include "sailroute/weather/csv_forecast_provider.hpp"

#include <cstddef>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "sailroute/geo/geo_math.hpp"
#include "sailroute/weather/wind_conversions.hpp"

namespace sailroute::weather {
namespace {

using sailroute::core::Status;

constexpr std::size_t kMinColumns = 4;
constexpr std::size_t kLatCol = 0;
constexpr std::size_t kLonCol = 1;
constexpr std::size_t kUCol = 2;
constexpr std::size_t kVCol = 3;
constexpr std::size_t kGustCol = 4;
constexpr std::size_t kWaveCol = 5;

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  fields.reserve(6);
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(token);
  }
  return fields;
}

bool parse_double(const std::string& text, double& value) {
  try {
    value = std::stod(text);
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

}  // namespace

std::unique_ptr<CsvForecastProvider> CsvForecastProvider::Create(const Config& config) {
  std::ifstream in(config.csv_file);
  if (!in) {
    spdlog::warn("forecast grid '{}' not readable", config.csv_file.string());
    return std::unique_ptr<CsvForecastProvider>(new CsvForecastProvider({}, config.max_distance_nm));
  }

  std::vector<GridNode> nodes;
  std::string line;
  std::size_t skipped = 0;
  while (std::getline(in, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }
    const auto fields = split_csv_line(line);
    if (fields.size() < kMinColumns) {
      ++skipped;
      continue;
    }

    double lat = 0.0;
    double lon = 0.0;
    WindComponents c{.timestamp = config.valid_time};
    if (!parse_double(fields[kLatCol], lat) || !parse_double(fields[kLonCol], lon) ||
        !parse_double(fields[kUCol], c.u_mps) || !parse_double(fields[kVCol], c.v_mps)) {
      ++skipped;  // header or malformed row
      continue;
    }
    double gust = 0.0;
    if (fields.size() > kGustCol && parse_double(fields[kGustCol], gust)) {
      c.gust_mps = gust;
    }
    if (fields.size() > kWaveCol) {
      double wave = 0.0;
      if (parse_double(fields[kWaveCol], wave)) {
        c.wave_height_m = wave;
      }
    }

    const sailroute::core::Coordinates at{.lat_deg = lat, .lon_deg = lon};
    if (!sailroute::geo::is_valid(at)) {
      ++skipped;
      continue;
    }
    nodes.push_back(GridNode{.coordinates = at, .forecast = to_forecast(c)});
  }
  if (skipped > 0U) {
    spdlog::debug("forecast grid '{}': skipped {} row(s)", config.csv_file.string(), skipped);
  }
  return std::unique_ptr<CsvForecastProvider>(new CsvForecastProvider(std::move(nodes), config.max_distance_nm));
}

sailroute::core::ForecastResult CsvForecastProvider::current_conditions(
    const sailroute::core::Coordinates& coordinates) const {
  if (!sailroute::geo::is_valid(coordinates)) {
    return sailroute::core::ForecastResult{.error = "Invalid coordinates", .status = Status::InvalidInput};
  }
  if (nodes_.empty()) {
    return sailroute::core::ForecastResult{.error = "No forecast data available", .status = Status::DataUnavailable};
  }

  const GridNode* best = nullptr;
  double best_nm = std::numeric_limits<double>::infinity();
  for (const auto& node : nodes_) {
    const double d = sailroute::geo::distance_nm(coordinates, node.coordinates);
    if (d < best_nm) {
      best_nm = d;
      best = &node;
    }
  }
  if (best == nullptr || best_nm > max_distance_nm_) {
    return sailroute::core::ForecastResult{
        .error = fmt::format("No forecast grid node within {:.0f} nm", max_distance_nm_),
        .status = Status::DataUnavailable};
  }
  return sailroute::core::ForecastResult{.forecast = best->forecast};
}

}  // namespace sailroute::weather
