/**
 * @file lagoon440.hpp
 * @brief Bundled factory polar for the Lagoon 440 catamaran.
 * @author Watosn
 */
#pragma once

#include "sailroute/polar/polar.hpp"

namespace sailroute::polar {

/**
 * @brief Lagoon 440 factory diagram: Main + Jib, Main + Genoa, Main + Spinnaker,
 * Main + Asymmetrical, Code Zero and Storm Jib + Reefed Main.
 */
[[nodiscard]] const PolarDiagram& lagoon440();

}  // namespace sailroute::polar
