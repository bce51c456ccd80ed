/**
 * @file polar.cpp
 * @brief Polar interpolation and VMG search implementation.
 * @author Watosn
 */

#include "sailroute/polar/polar.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/format.h>

#include "sailroute/core/constants.hpp"

namespace sailroute::polar {
namespace {

using sailroute::core::Status;
namespace constants = sailroute::core::constants;

template <typename T, typename Key>
std::vector<const T*> sorted_by(const std::vector<T>& items, Key key) {
  std::vector<const T*> out;
  out.reserve(items.size());
  for (const auto& item : items) {
    out.push_back(&item);
  }
  std::stable_sort(out.begin(), out.end(), [&key](const T* a, const T* b) { return key(*a) < key(*b); });
  return out;
}

struct Bracket {
  std::size_t lower{};
  std::size_t upper{};
  double weight{};
};

// Bracket `x` in an ascending axis; values outside the axis clamp to the boundary entry.
template <typename Axis>
Bracket bracket(std::size_t count, double x, Axis axis) {
  if (count == 0U) {
    return {};
  }
  if (x <= axis(0)) {
    return Bracket{.lower = 0, .upper = 0, .weight = 0.0};
  }
  const std::size_t last = count - 1U;
  if (x >= axis(last)) {
    return Bracket{.lower = last, .upper = last, .weight = 0.0};
  }
  for (std::size_t i = 0; i < last; ++i) {
    const double lo = axis(i);
    const double hi = axis(i + 1U);
    if (x >= lo && x <= hi) {
      const double span = hi - lo;
      return Bracket{.lower = i, .upper = i + 1U, .weight = span > 0.0 ? (x - lo) / span : 0.0};
    }
  }
  return Bracket{.lower = last, .upper = last, .weight = 0.0};
}

double curve_speed(const PolarCurve& curve, double twa_deg) {
  if (curve.points.empty()) {
    return 0.0;
  }
  const auto points = sorted_by(curve.points, [](const PolarPoint& p) { return p.twa_deg; });
  const auto b = bracket(points.size(), twa_deg, [&points](std::size_t i) { return points[i]->twa_deg; });
  const double lo = points[b.lower]->speed_kt;
  const double hi = points[b.upper]->speed_kt;
  return lo + (hi - lo) * b.weight;
}

}  // namespace

double normalize_twa(double twa_deg) {
  if (!std::isfinite(twa_deg)) {
    return 0.0;
  }
  double a = std::fmod(twa_deg, 360.0);
  if (a < 0.0) {
    a += 360.0;
  }
  return a > 180.0 ? 360.0 - a : a;
}

double vmg(double speed_kt, double twa_deg) { return speed_kt * std::cos(twa_deg * constants::kDegToRad); }

const SailConfigPolar* find_config(const PolarDiagram& diagram, std::string_view sail_config) {
  if (diagram.polar_data.empty()) {
    return nullptr;
  }
  if (!sail_config.empty()) {
    const auto it = std::find_if(diagram.polar_data.begin(), diagram.polar_data.end(),
                                 [sail_config](const SailConfigPolar& p) { return p.sail_config == sail_config; });
    if (it != diagram.polar_data.end()) {
      return &*it;
    }
  }
  return &diagram.polar_data.front();
}

PolarSample evaluate(const PolarDiagram& diagram, double tws_kt, double twa_deg, std::string_view sail_config) {
  const SailConfigPolar* config = find_config(diagram, sail_config);
  if (config == nullptr || config->curves.empty()) {
    return PolarSample{.status = Status::DataUnavailable};
  }
  if (!std::isfinite(tws_kt) || !std::isfinite(twa_deg)) {
    return PolarSample{.sail_config = config->sail_config, .status = Status::InvalidInput};
  }

  const double twa = normalize_twa(twa_deg);
  const auto curves = sorted_by(config->curves, [](const PolarCurve& c) { return c.tws_kt; });
  const auto b = bracket(curves.size(), tws_kt, [&curves](std::size_t i) { return curves[i]->tws_kt; });

  const double lower = curve_speed(*curves[b.lower], twa);
  const double upper = curve_speed(*curves[b.upper], twa);
  const double s = lower + (upper - lower) * b.weight;
  return PolarSample{.speed_kt = s, .vmg_kt = vmg(s, twa), .sail_config = config->sail_config, .status = Status::Ok};
}

double speed(const PolarDiagram& diagram, double tws_kt, double twa_deg, std::string_view sail_config) {
  const auto sample = evaluate(diagram, tws_kt, twa_deg, sail_config);
  return sample.status == Status::Ok ? sample.speed_kt : 0.0;
}

OptimalVmg find_optimal_vmg(const PolarDiagram& diagram, double tws_kt, std::string_view sail_config) {
  OptimalVmg out{};
  if (find_config(diagram, sail_config) == nullptr) {
    out.status = Status::DataUnavailable;
    return out;
  }
  if (!std::isfinite(tws_kt)) {
    out.status = Status::InvalidInput;
    return out;
  }

  double best_up = -std::numeric_limits<double>::infinity();
  double best_down = std::numeric_limits<double>::infinity();
  for (int twa = 30; twa <= 180; ++twa) {
    const double s = speed(diagram, tws_kt, twa, sail_config);
    const double v = vmg(s, twa);
    if (twa < 90 && v > best_up) {
      best_up = v;
      out.upwind = VmgPoint{.twa_deg = static_cast<double>(twa), .speed_kt = s, .vmg_kt = v};
    }
    if (twa > 90 && v < best_down) {
      best_down = v;
      out.downwind = VmgPoint{.twa_deg = static_cast<double>(twa), .speed_kt = s, .vmg_kt = std::abs(v)};
    }
  }
  return out;
}

PolarPerformance performance(const PolarDiagram& diagram, double tws_kt, double twa_deg, double actual_speed_kt,
                             std::string_view sail_config) {
  const auto sample = evaluate(diagram, tws_kt, twa_deg, sail_config);
  if (sample.status != Status::Ok) {
    return PolarPerformance{.actual_speed_kt = actual_speed_kt, .status = sample.status};
  }
  if (!std::isfinite(actual_speed_kt) || actual_speed_kt < 0.0) {
    return PolarPerformance{.target_speed_kt = sample.speed_kt, .status = Status::InvalidInput};
  }
  const double target = sample.speed_kt;
  return PolarPerformance{
      .target_speed_kt = target,
      .actual_speed_kt = actual_speed_kt,
      .performance_pct = target > 0.0 ? actual_speed_kt / target * 100.0 : 0.0,
      .speed_difference_kt = actual_speed_kt - target,
      .status = Status::Ok,
  };
}

PolarValidation validate(const PolarDiagram& diagram) {
  if (diagram.polar_data.empty()) {
    return PolarValidation{.status = Status::InvalidInput, .message = "polar has no sail configurations"};
  }
  for (const auto& config : diagram.polar_data) {
    if (config.curves.empty()) {
      return PolarValidation{.status = Status::InvalidInput,
                             .message = fmt::format("configuration '{}' has no curves", config.sail_config)};
    }
    for (const auto& curve : config.curves) {
      if (curve.points.empty()) {
        return PolarValidation{
            .status = Status::InvalidInput,
            .message = fmt::format("configuration '{}' curve TWS {} has no points", config.sail_config, curve.tws_kt)};
      }
      const auto points = sorted_by(curve.points, [](const PolarPoint& p) { return p.twa_deg; });
      for (std::size_t i = 1; i < points.size(); ++i) {
        if (!(points[i]->twa_deg > points[i - 1U]->twa_deg)) {
          return PolarValidation{.status = Status::InvalidInput,
                                 .message = fmt::format("configuration '{}' curve TWS {} repeats TWA {}",
                                                        config.sail_config, curve.tws_kt, points[i]->twa_deg)};
        }
      }
      for (const auto& p : curve.points) {
        if (!std::isfinite(p.speed_kt) || p.speed_kt < 0.0 || p.twa_deg < 0.0 || p.twa_deg > 180.0) {
          return PolarValidation{.status = Status::InvalidInput,
                                 .message = fmt::format("configuration '{}' curve TWS {} has an invalid point at TWA {}",
                                                        config.sail_config, curve.tws_kt, p.twa_deg)};
        }
      }
    }
  }
  return PolarValidation{};
}

}  // namespace sailroute::polar
