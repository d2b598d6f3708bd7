#pragma once

#include "procure/domain/simulation_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace procure {

// -----------------------------------------------------------------------------
// Simulation config loading
// -----------------------------------------------------------------------------
//
// @brief  Overlays a JSON document onto the SimulationConfig defaults.
//
// @details
// Keys match the SimulationConfig field names. Every key is optional:
// absent keys keep their default, unknown keys are ignored, and a key whose
// value has the wrong JSON type is logged to std::cerr and skipped.
//
// Errors that make the result unusable throw std::runtime_error:
//   - the file cannot be opened, or is not valid JSON;
//   - the root is not an object;
//   - a range is inverted (min_price > max_price, min_score > max_score,
//     min/max delay, contract or delivery lead days), or a probability
//     lies outside [0, 1].
//
// Example:
//   { "supplier_count": 25, "fallback_contract_probability": 1.0 }
// -----------------------------------------------------------------------------

domain::SimulationConfig loadSimulationConfig(const std::string& path);

domain::SimulationConfig parseSimulationConfig(const nlohmann::json& doc);

// Throws std::runtime_error naming the first inconsistent field.
void validateSimulationConfig(const domain::SimulationConfig& config);

}  // namespace procure
