/**
 * @file coordinate_parser.hpp
 * @brief Parsing and formatting of textual positions (DD, DDM, DMS).
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "sailroute/core/types.hpp"

namespace sailroute::geo {

/**
 * @brief Notation a position was written in.
 */
enum class CoordinateFormat : std::uint8_t { Unknown, DecimalDegrees, DegreesDecimalMinutes, DegreesMinutesSeconds };

/**
 * @brief Parsed position with the detected notation.
 */
struct CoordinateParseResult {
  sailroute::core::Coordinates coordinates{};
  CoordinateFormat format{CoordinateFormat::Unknown};
  sailroute::core::Status status{sailroute::core::Status::Ok};
};

/**
 * @brief Parse a position such as "25.7617, -80.1918", "25 45.702 N, 80 11.508 W" or
 * "25°45'42.12\"N, 80°11'30.48\"W".
 *
 * Notations are tried from the most to the least specific: DMS, DDM, DD.
 * Out-of-range results are rejected with `Status::InvalidInput`.
 */
[[nodiscard]] CoordinateParseResult parse_coordinates(std::string_view text);

[[nodiscard]] std::string format_dd(const sailroute::core::Coordinates& c);
[[nodiscard]] std::string format_ddm(const sailroute::core::Coordinates& c);
[[nodiscard]] std::string format_dms(const sailroute::core::Coordinates& c);

}  // namespace sailroute::geo
