/**
 * @file polar_csv.hpp
 * @brief Loader for polar diagrams stored as flat CSV rows.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "sailroute/polar/polar.hpp"

namespace sailroute::polar {

struct PolarLoadResult {
  PolarDiagram diagram{};
  sailroute::core::Status status{sailroute::core::Status::Ok};
  std::string message{};
};

/**
 * @brief Parse polar rows `config,tws,twa,speed[,vmg]`.
 *
 * Blank lines and lines starting with `#` are ignored, as is a first row whose TWS
 * column is not numeric (header). A missing VMG column is derived from speed and TWA.
 * Configurations keep their first-seen order; curves and points are sorted ascending.
 */
[[nodiscard]] PolarLoadResult parse_polar_csv(std::string_view text, std::string_view name = "custom");

[[nodiscard]] PolarLoadResult load_polar_csv(const std::filesystem::path& path);

}  // namespace sailroute::polar
