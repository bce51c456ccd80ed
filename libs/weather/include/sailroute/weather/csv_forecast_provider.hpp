/**
 * @file csv_forecast_provider.hpp
 * @brief Point-forecast provider backed by a gridded u/v wind CSV.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "sailroute/core/interfaces.hpp"

namespace sailroute::weather {

/**
 * @brief Nearest-node lookup over a wind grid exported as CSV.
 *
 * Rows are `lat,lon,u_mps,v_mps[,gust_mps[,wave_m]]`; a header row and `#` comments
 * are skipped.
 */
class CsvForecastProvider final : public sailroute::core::IForecastProvider {
 public:
  /**
   * @brief One grid node converted to sailing units.
   */
  struct GridNode {
    sailroute::core::Coordinates coordinates{};
    sailroute::core::WindForecast forecast{};
  };

  /**
   * @brief CSV provider configuration.
   */
  struct Config {
    std::filesystem::path csv_file{};
    sailroute::core::Epoch valid_time{};
    double max_distance_nm{120.0};  ///< queries farther than this from every node fail
  };

  /**
   * @brief Factory helper that parses CSV input. An unreadable file yields an empty grid.
   */
  static std::unique_ptr<CsvForecastProvider> Create(const Config& config);

  [[nodiscard]] sailroute::core::ForecastResult current_conditions(
      const sailroute::core::Coordinates& coordinates) const override;

  [[nodiscard]] std::size_t size() const { return nodes_.size(); }

 private:
  CsvForecastProvider(std::vector<GridNode> nodes, double max_distance_nm)
      : nodes_(std::move(nodes)), max_distance_nm_(max_distance_nm) {}

  std::vector<GridNode> nodes_{};
  double max_distance_nm_{};
};

}  // namespace sailroute::weather
