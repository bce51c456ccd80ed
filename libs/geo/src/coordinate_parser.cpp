/**
 * @file coordinate_parser.cpp
 * @brief Textual position parsing/formatting implementation.
 * @author Watosn
 */

#include "sailroute/geo/coordinate_parser.hpp"

#include <cctype>
#include <cmath>
#include <optional>
#include <regex>
#include <stdexcept>

#include <fmt/format.h>

#include "sailroute/geo/geo_math.hpp"

namespace sailroute::geo {
namespace {

using sailroute::core::Coordinates;
using sailroute::core::Status;

const std::string kDegreeSep = "(?:°|\\s)+";
const std::string kNumber = "(\\d+(?:\\.\\d*)?)";
const std::string kSignedNumber = "(-?\\d+(?:\\.\\d*)?)";

const std::regex& dms_pattern() {
  static const std::regex re("([NS])?\\s*(\\d+)" + kDegreeSep + "(\\d+)(?:'|\\s)+" + kNumber +
                                 "(?:\"|'|\\s)*([NS])?\\s*(?:,|\\s)+([EW])?\\s*(\\d+)" + kDegreeSep +
                                 "(\\d+)(?:'|\\s)+" + kNumber + "(?:\"|'|\\s)*([EW])?",
                             std::regex::ECMAScript | std::regex::icase);
  return re;
}

const std::regex& ddm_pattern() {
  static const std::regex re("([NS])?\\s*(\\d+)" + kDegreeSep + kNumber + "(?:'|\\s)*([NS])?\\s*(?:,|\\s)+([EW])?\\s*(\\d+)" +
                                 kDegreeSep + kNumber + "(?:'|\\s)*([EW])?",
                             std::regex::ECMAScript | std::regex::icase);
  return re;
}

const std::regex& dd_simple_pattern() {
  static const std::regex re("^" + kSignedNumber + "\\s*,\\s*" + kSignedNumber + "$", std::regex::ECMAScript);
  return re;
}

const std::regex& dd_hemisphere_pattern() {
  static const std::regex re("([NS])?\\s*" + kSignedNumber + "\\s*([NS])?\\s*(?:,|\\s)+([EW])?\\s*" + kSignedNumber +
                                 "\\s*([EW])?",
                             std::regex::ECMAScript | std::regex::icase);
  return re;
}

std::optional<double> parse_double(const std::string& text) {
  try {
    return std::stod(text);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

char hemisphere(const std::ssub_match& first, const std::ssub_match& second) {
  const std::string h = first.matched ? first.str() : (second.matched ? second.str() : std::string{});
  return h.empty() ? '\0' : static_cast<char>(std::toupper(static_cast<unsigned char>(h[0])));
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

CoordinateParseResult accept(double lat, double lon, CoordinateFormat format) {
  const Coordinates c{.lat_deg = lat, .lon_deg = lon};
  if (!is_valid(c)) {
    return CoordinateParseResult{.format = format, .status = Status::InvalidInput};
  }
  return CoordinateParseResult{.coordinates = c, .format = format, .status = Status::Ok};
}

std::optional<CoordinateParseResult> parse_dms(const std::string& text) {
  std::smatch m;
  if (!std::regex_search(text, m, dms_pattern())) {
    return std::nullopt;
  }
  const auto lat_d = parse_double(m[2].str());
  const auto lat_m = parse_double(m[3].str());
  const auto lat_s = parse_double(m[4].str());
  const auto lon_d = parse_double(m[7].str());
  const auto lon_m = parse_double(m[8].str());
  const auto lon_s = parse_double(m[9].str());
  if (!lat_d || !lat_m || !lat_s || !lon_d || !lon_m || !lon_s) {
    return std::nullopt;
  }
  double lat = *lat_d + *lat_m / 60.0 + *lat_s / 3600.0;
  double lon = *lon_d + *lon_m / 60.0 + *lon_s / 3600.0;
  if (hemisphere(m[1], m[5]) == 'S') {
    lat = -lat;
  }
  if (hemisphere(m[6], m[10]) == 'W') {
    lon = -lon;
  }
  return accept(lat, lon, CoordinateFormat::DegreesMinutesSeconds);
}

std::optional<CoordinateParseResult> parse_ddm(const std::string& text) {
  std::smatch m;
  if (!std::regex_search(text, m, ddm_pattern())) {
    return std::nullopt;
  }
  const auto lat_d = parse_double(m[2].str());
  const auto lat_m = parse_double(m[3].str());
  const auto lon_d = parse_double(m[6].str());
  const auto lon_m = parse_double(m[7].str());
  if (!lat_d || !lat_m || !lon_d || !lon_m) {
    return std::nullopt;
  }
  double lat = *lat_d + *lat_m / 60.0;
  double lon = *lon_d + *lon_m / 60.0;
  if (hemisphere(m[1], m[4]) == 'S') {
    lat = -lat;
  }
  if (hemisphere(m[5], m[8]) == 'W') {
    lon = -lon;
  }
  return accept(lat, lon, CoordinateFormat::DegreesDecimalMinutes);
}

std::optional<CoordinateParseResult> parse_dd(const std::string& text) {
  std::smatch m;
  if (std::regex_match(text, m, dd_simple_pattern())) {
    const auto lat = parse_double(m[1].str());
    const auto lon = parse_double(m[2].str());
    if (lat && lon) {
      return accept(*lat, *lon, CoordinateFormat::DecimalDegrees);
    }
  }

  if (!std::regex_search(text, m, dd_hemisphere_pattern())) {
    return std::nullopt;
  }
  const auto lat_v = parse_double(m[2].str());
  const auto lon_v = parse_double(m[5].str());
  if (!lat_v || !lon_v) {
    return std::nullopt;
  }
  double lat = *lat_v;
  double lon = *lon_v;
  switch (hemisphere(m[1], m[3])) {
    case 'S':
      lat = -std::abs(lat);
      break;
    case 'N':
      lat = std::abs(lat);
      break;
    default:
      break;
  }
  switch (hemisphere(m[4], m[6])) {
    case 'W':
      lon = -std::abs(lon);
      break;
    case 'E':
      lon = std::abs(lon);
      break;
    default:
      break;
  }
  return accept(lat, lon, CoordinateFormat::DecimalDegrees);
}

struct Sexagesimal {
  int degrees{};
  double minutes{};
};

Sexagesimal split_degrees(double value) {
  const double a = std::abs(value);
  const double deg = std::floor(a);
  return Sexagesimal{.degrees = static_cast<int>(deg), .minutes = (a - deg) * 60.0};
}

}  // namespace

CoordinateParseResult parse_coordinates(std::string_view text) {
  const std::string input(trim(text));
  if (input.empty()) {
    return CoordinateParseResult{.status = Status::InvalidInput};
  }
  if (auto r = parse_dms(input)) {
    return *r;
  }
  if (auto r = parse_ddm(input)) {
    return *r;
  }
  if (auto r = parse_dd(input)) {
    return *r;
  }
  return CoordinateParseResult{.status = Status::InvalidInput};
}

std::string format_dd(const Coordinates& c) { return fmt::format("{:.6f}, {:.6f}", c.lat_deg, c.lon_deg); }

std::string format_ddm(const Coordinates& c) {
  const auto lat = split_degrees(c.lat_deg);
  const auto lon = split_degrees(c.lon_deg);
  return fmt::format("{}°{:.4f}'{}, {}°{:.4f}'{}", lat.degrees, lat.minutes, c.lat_deg >= 0.0 ? 'N' : 'S', lon.degrees,
                     lon.minutes, c.lon_deg >= 0.0 ? 'E' : 'W');
}

std::string format_dms(const Coordinates& c) {
  const auto lat = split_degrees(c.lat_deg);
  const auto lon = split_degrees(c.lon_deg);
  const double lat_min = std::floor(lat.minutes);
  const double lon_min = std::floor(lon.minutes);
  return fmt::format("{}°{}'{:.2f}\"{}, {}°{}'{:.2f}\"{}", lat.degrees, static_cast<int>(lat_min),
                     (lat.minutes - lat_min) * 60.0, c.lat_deg >= 0.0 ? 'N' : 'S', lon.degrees,
                     static_cast<int>(lon_min), (lon.minutes - lon_min) * 60.0, c.lon_deg >= 0.0 ? 'E' : 'W');
}

}  // namespace sailroute::geo
