/**
 * @file polar_csv.cpp
 * @brief Polar CSV loader implementation.
 * @author Watosn
 */

#include "sailroute/polar/polar_csv.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace sailroute::polar {
namespace {

using sailroute::core::Status;

constexpr std::size_t kConfigCol = 0;
constexpr std::size_t kTwsCol = 1;
constexpr std::size_t kTwaCol = 2;
constexpr std::size_t kSpeedCol = 3;
constexpr std::size_t kVmgCol = 4;
constexpr std::size_t kMinColumns = 4;

std::string trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  return first < last ? std::string(first, last) : std::string{};
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(trim(token));
  }
  return fields;
}

bool parse_double(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  std::size_t used = 0;
  try {
    value = std::stod(text, &used);
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
  return used == text.size();
}

PolarCurve& curve_for(SailConfigPolar& config, double tws_kt) {
  const auto it = std::find_if(config.curves.begin(), config.curves.end(),
                               [tws_kt](const PolarCurve& c) { return c.tws_kt == tws_kt; });
  if (it != config.curves.end()) {
    return *it;
  }
  config.curves.push_back(PolarCurve{.tws_kt = tws_kt});
  return config.curves.back();
}

SailConfigPolar& config_for(PolarDiagram& diagram, const std::string& name) {
  const auto it = std::find_if(diagram.polar_data.begin(), diagram.polar_data.end(),
                               [&name](const SailConfigPolar& p) { return p.sail_config == name; });
  if (it != diagram.polar_data.end()) {
    return *it;
  }
  diagram.polar_data.push_back(SailConfigPolar{.sail_config = name});
  return diagram.polar_data.back();
}

void finalize(PolarDiagram& diagram) {
  for (auto& config : diagram.polar_data) {
    std::sort(config.curves.begin(), config.curves.end(),
              [](const PolarCurve& a, const PolarCurve& b) { return a.tws_kt < b.tws_kt; });
    for (auto& curve : config.curves) {
      std::sort(curve.points.begin(), curve.points.end(),
                [](const PolarPoint& a, const PolarPoint& b) { return a.twa_deg < b.twa_deg; });
    }
    if (!config.curves.empty()) {
      config.wind_min_kt = config.curves.front().tws_kt;
      config.wind_max_kt = config.curves.back().tws_kt;
    }
  }
}

}  // namespace

PolarLoadResult parse_polar_csv(std::string_view text, std::string_view name) {
  PolarLoadResult out{};
  out.diagram.id = std::string(name);
  out.diagram.name = std::string(name);

  std::istringstream in{std::string(text)};
  std::string line;
  std::size_t line_no = 0;
  bool first_data_row = true;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string row = trim(line);
    if (row.empty() || row.front() == '#') {
      continue;
    }
    const auto fields = split_csv_line(row);
    if (fields.size() < kMinColumns) {
      return PolarLoadResult{.status = Status::InvalidInput,
                             .message = fmt::format("line {}: expected config,tws,twa,speed[,vmg]", line_no)};
    }

    double tws = 0.0;
    double twa = 0.0;
    double spd = 0.0;
    if (!parse_double(fields[kTwsCol], tws)) {
      if (first_data_row) {
        first_data_row = false;
        continue;
      }
      return PolarLoadResult{.status = Status::InvalidInput,
                             .message = fmt::format("line {}: invalid TWS '{}'", line_no, fields[kTwsCol])};
    }
    first_data_row = false;
    if (!parse_double(fields[kTwaCol], twa) || twa < 0.0 || twa > 180.0) {
      return PolarLoadResult{.status = Status::InvalidInput,
                             .message = fmt::format("line {}: invalid TWA '{}'", line_no, fields[kTwaCol])};
    }
    if (!parse_double(fields[kSpeedCol], spd) || spd < 0.0) {
      return PolarLoadResult{.status = Status::InvalidInput,
                             .message = fmt::format("line {}: invalid speed '{}'", line_no, fields[kSpeedCol])};
    }
    if (fields[kConfigCol].empty()) {
      return PolarLoadResult{.status = Status::InvalidInput,
                             .message = fmt::format("line {}: missing sail configuration", line_no)};
    }

    double v = vmg(spd, twa);
    if (fields.size() > kVmgCol && !fields[kVmgCol].empty() && !parse_double(fields[kVmgCol], v)) {
      return PolarLoadResult{.status = Status::InvalidInput,
                             .message = fmt::format("line {}: invalid VMG '{}'", line_no, fields[kVmgCol])};
    }

    auto& config = config_for(out.diagram, fields[kConfigCol]);
    curve_for(config, tws).points.push_back(PolarPoint{.twa_deg = twa, .speed_kt = spd, .vmg_kt = v});
  }

  finalize(out.diagram);
  const auto check = validate(out.diagram);
  if (check.status != Status::Ok) {
    return PolarLoadResult{.status = check.status, .message = check.message};
  }
  out.message = fmt::format("loaded {} sail configuration(s)", out.diagram.polar_data.size());
  return out;
}

PolarLoadResult load_polar_csv(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    spdlog::warn("polar file '{}' not readable", path.string());
    return PolarLoadResult{.status = Status::DataUnavailable,
                           .message = fmt::format("cannot open polar file '{}'", path.string())};
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  auto out = parse_polar_csv(buffer.str(), path.stem().string());
  if (out.status != Status::Ok) {
    spdlog::warn("polar file '{}': {}", path.string(), out.message);
  }
  return out;
}

}  // namespace sailroute::polar
