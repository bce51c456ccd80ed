/**
 * @file lagoon440.cpp
 * @brief Lagoon 440 factory polar tables.
 * @author Watosn
 */

#include "sailroute/polar/lagoon440.hpp"

#include <initializer_list>

namespace sailroute::polar {
namespace {

struct Row {
  double twa_deg;
  double speed_kt;
  double vmg_kt;
};

PolarCurve curve(double tws_kt, std::initializer_list<Row> rows) {
  PolarCurve out{.tws_kt = tws_kt};
  out.points.reserve(rows.size());
  for (const auto& r : rows) {
    out.points.push_back(PolarPoint{.twa_deg = r.twa_deg, .speed_kt = r.speed_kt, .vmg_kt = r.vmg_kt});
  }
  return out;
}

// Clean hulls, standard sails, normal cruising load.
PolarDiagram build_lagoon440() {
  PolarDiagram d{
      .id = "lagoon-440-default",
      .name = "Lagoon 440 - Factory Standard",
      .boat_type = "Catamaran",
      .boat_model = "Lagoon 440",
      .description = "Factory standard polar diagram for Lagoon 440 catamaran.",
      .length_m = 13.61,
      .beam_m = 7.7,
      .displacement_t = 12.0,
      .sail_area = SailArea{.main_m2 = 54.0,
                            .jib_m2 = 49.0,
                            .genoa_m2 = 58.0,
                            .spinnaker_m2 = 110.0,
                            .asymmetrical_m2 = 105.0,
                            .code_zero_m2 = 95.0},
  };
  d.polar_data = {
      SailConfigPolar{
          .sail_config = "Main + Jib",
          .description = "Standard cruising configuration for upwind and reaching",
          .wind_min_kt = 6,
          .wind_max_kt = 30,
          .curves =
              {
              curve(6,
                    {
                       {40, 4.2, 3.2},
                       {45, 4.5, 3.2},
                       {50, 4.9, 3.1},
                       {52, 5.1, 3.1},
                       {60, 5.4, 2.7},
                       {75, 5.6, 1.4},
                       {90, 5.5, 0.0},
                       {110, 5.2, -1.8},
                       {120, 4.9, -2.4},
                       {135, 4.5, -3.2},
                       {150, 4.0, -3.5},
                       {165, 3.5, -3.4},
                       {180, 3.2, -3.2},
                    }),
              curve(8,
                    {
                       {40, 5.1, 3.9},
                       {45, 5.5, 3.9},
                       {50, 5.9, 3.8},
                       {52, 6.0, 3.7},
                       {60, 6.4, 3.2},
                       {75, 6.7, 1.7},
                       {90, 6.6, 0.0},
                       {110, 6.3, -2.2},
                       {120, 6.0, -3.0},
                       {135, 5.5, -3.9},
                       {150, 5.0, -4.3},
                       {165, 4.4, -4.3},
                       {180, 4.0, -4.0},
                    }),
              curve(10,
                    {
                       {40, 5.8, 4.4},
                       {45, 6.3, 4.5},
                       {50, 6.8, 4.4},
                       {52, 6.7, 4.1},
                       {60, 7.2, 3.6},
                       {75, 7.6, 2.0},
                       {90, 7.5, 0.0},
                       {110, 7.2, -2.5},
                       {120, 6.9, -3.5},
                       {135, 6.4, -4.5},
                       {150, 5.8, -5.0},
                       {165, 5.1, -5.0},
                       {180, 4.7, -4.7},
                    }),
              curve(12,
                    {
                       {40, 6.3, 4.8},
                       {45, 6.9, 4.9},
                       {50, 7.5, 4.8},
                       {52, 7.3, 4.5},
                       {60, 7.9, 4.0},
                       {75, 8.4, 2.2},
                       {90, 8.3, 0.0},
                       {110, 8.0, -2.7},
                       {120, 7.6, -3.8},
                       {135, 7.1, -5.0},
                       {150, 6.5, -5.6},
                       {165, 5.7, -5.6},
                       {180, 5.2, -5.2},
                    }),
              curve(14,
                    {
                       {40, 6.7, 5.1},
                       {45, 7.4, 5.2},
                       {50, 8.1, 5.2},
                       {52, 7.8, 4.8},
                       {60, 8.5, 4.3},
                       {75, 9.0, 2.3},
                       {90, 8.9, 0.0},
                       {110, 8.6, -2.9},
                       {120, 8.2, -4.1},
                       {135, 7.7, -5.4},
                       {150, 7.0, -6.1},
                       {165, 6.2, -6.1},
                       {180, 5.6, -5.6},
                    }),
              curve(16,
                    {
                       {40, 7.0, 5.4},
                       {45, 7.8, 5.5},
                       {50, 8.6, 5.5},
                       {52, 8.2, 5.0},
                       {60, 8.9, 4.5},
                       {75, 9.5, 2.5},
                       {90, 9.4, 0.0},
                       {110, 9.1, -3.1},
                       {120, 8.7, -4.4},
                       {135, 8.1, -5.7},
                       {150, 7.4, -6.4},
                       {165, 6.5, -6.4},
                       {180, 5.9, -5.9},
                    }),
              curve(20,
                    {
                       {40, 7.4, 5.7},
                       {45, 8.3, 5.9},
                       {50, 9.2, 5.9},
                       {52, 8.7, 5.3},
                       {60, 9.5, 4.8},
                       {75, 10.2, 2.6},
                       {90, 10.1, 0.0},
                       {110, 9.8, -3.4},
                       {120, 9.3, -4.7},
                       {135, 8.7, -6.2},
                       {150, 8.0, -6.9},
                       {165, 7.0, -6.9},
                       {180, 6.4, -6.4},
                    }),
              curve(25,
                    {
                       {40, 7.7, 5.9},
                       {45, 8.7, 6.2},
                       {50, 9.7, 6.2},
                       {52, 9.1, 5.6},
                       {60, 10.0, 5.0},
                       {75, 10.7, 2.8},
                       {90, 10.6, 0.0},
                       {110, 10.3, -3.5},
                       {120, 9.8, -4.9},
                       {135, 9.2, -6.5},
                       {150, 8.4, -7.3},
                       {165, 7.4, -7.3},
                       {180, 6.7, -6.7},
                    }),
              },
      },
      SailConfigPolar{
          .sail_config = "Main + Genoa",
          .description = "Larger headsail for better light air performance",
          .wind_min_kt = 4,
          .wind_max_kt = 20,
          .curves =
              {
              curve(6,
                    {
                       {40, 4.5, 3.4},
                       {45, 4.9, 3.5},
                       {52, 5.4, 3.3},
                       {60, 5.7, 2.9},
                       {75, 5.9, 1.5},
                       {90, 5.8, 0.0},
                       {110, 5.4, -1.8},
                       {120, 5.1, -2.6},
                       {135, 4.7, -3.3},
                       {150, 4.2, -3.6},
                       {180, 3.4, -3.4},
                    }),
              curve(10,
                    {
                       {40, 6.2, 4.7},
                       {45, 6.7, 4.7},
                       {52, 7.1, 4.4},
                       {60, 7.6, 3.8},
                       {75, 8.0, 2.1},
                       {90, 7.9, 0.0},
                       {110, 7.5, -2.6},
                       {120, 7.1, -3.6},
                       {135, 6.6, -4.7},
                       {150, 6.0, -5.2},
                       {180, 4.9, -4.9},
                    }),
              },
      },
      SailConfigPolar{
          .sail_config = "Main + Spinnaker",
          .description = "Symmetric spinnaker for deep downwind angles",
          .wind_min_kt = 6,
          .wind_max_kt = 20,
          .curves =
              {
              curve(10,
                    {
                       {90, 8.5, 0.0},
                       {110, 9.2, -3.1},
                       {120, 9.8, -4.9},
                       {135, 10.1, -7.1},
                       {150, 9.8, -8.5},
                       {165, 9.2, -9.0},
                       {180, 8.7, -8.7},
                    }),
              curve(14,
                    {
                       {90, 10.2, 0.0},
                       {110, 11.1, -3.8},
                       {120, 11.8, -5.9},
                       {135, 12.1, -8.6},
                       {150, 11.7, -10.1},
                       {165, 11.0, -10.8},
                       {180, 10.4, -10.4},
                    }),
              curve(18,
                    {
                       {90, 11.5, 0.0},
                       {110, 12.5, -4.3},
                       {120, 13.2, -6.6},
                       {135, 13.5, -9.5},
                       {150, 13.0, -11.3},
                       {165, 12.2, -12.0},
                       {180, 11.5, -11.5},
                    }),
              },
      },
      SailConfigPolar{
          .sail_config = "Main + Asymmetrical",
          .description = "Asymmetrical spinnaker for fast reaching",
          .wind_min_kt = 6,
          .wind_max_kt = 25,
          .curves =
              {
              curve(10,
                    {
                       {60, 8.2, 4.1},
                       {75, 9.1, 2.4},
                       {90, 9.8, 0.0},
                       {110, 10.5, -3.6},
                       {120, 10.8, -5.4},
                       {135, 10.4, -7.4},
                       {150, 9.5, -8.2},
                       {165, 8.4, -8.2},
                    }),
              curve(14,
                    {
                       {60, 9.8, 4.9},
                       {75, 10.9, 2.8},
                       {90, 11.7, 0.0},
                       {110, 12.5, -4.3},
                       {120, 12.9, -6.5},
                       {135, 12.4, -8.8},
                       {150, 11.3, -9.8},
                       {165, 10.0, -9.8},
                    }),
              curve(18,
                    {
                       {60, 11.0, 5.5},
                       {75, 12.2, 3.2},
                       {90, 13.1, 0.0},
                       {110, 13.9, -4.8},
                       {120, 14.3, -7.2},
                       {135, 13.7, -9.7},
                       {150, 12.5, -10.8},
                       {165, 11.0, -10.8},
                    }),
              },
      },
      SailConfigPolar{
          .sail_config = "Code Zero",
          .description = "Code zero for light air reaching and close reaching",
          .wind_min_kt = 3,
          .wind_max_kt = 12,
          .curves =
              {
              curve(6,
                    {
                       {40, 5.0, 3.8},
                       {50, 5.8, 3.7},
                       {60, 6.4, 3.2},
                       {75, 6.8, 1.8},
                       {90, 6.9, 0.0},
                       {110, 6.5, -2.2},
                       {120, 6.0, -3.0},
                    }),
              curve(10,
                    {
                       {40, 7.2, 5.5},
                       {50, 8.3, 5.3},
                       {60, 9.1, 4.6},
                       {75, 9.7, 2.5},
                       {90, 9.9, 0.0},
                       {110, 9.3, -3.2},
                       {120, 8.5, -4.3},
                    }),
              },
      },
      SailConfigPolar{
          .sail_config = "Storm Jib + Reefed Main",
          .description = "Heavy weather configuration with reduced sail area",
          .wind_min_kt = 25,
          .wind_max_kt = 50,
          .curves =
              {
              curve(30,
                    {
                       {45, 6.5, 4.6},
                       {52, 6.8, 4.2},
                       {60, 7.2, 3.6},
                       {75, 7.5, 1.9},
                       {90, 7.4, 0.0},
                       {110, 7.0, -2.4},
                       {120, 6.6, -3.3},
                       {135, 6.1, -4.3},
                       {150, 5.5, -4.8},
                       {180, 4.8, -4.8},
                    }),
              curve(40,
                    {
                       {45, 7.2, 5.1},
                       {52, 7.5, 4.6},
                       {60, 7.9, 4.0},
                       {75, 8.2, 2.1},
                       {90, 8.1, 0.0},
                       {110, 7.7, -2.6},
                       {120, 7.2, -3.6},
                       {135, 6.7, -4.7},
                       {150, 6.0, -5.2},
                       {180, 5.2, -5.2},
                    }),
              },
      },
  };
  return d;
}

}  // namespace

const PolarDiagram& lagoon440() {
  static const PolarDiagram diagram = build_lagoon440();
  return diagram;
}

}  // namespace sailroute::polar
