#include "procure/config/config_loader.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace procure {

namespace {

// Overwrites `field` when `key` is present with a usable type.
template <typename T>
void overlay(const nlohmann::json& doc, const char* key, T& field) {
  auto it = doc.find(key);
  if (it == doc.end()) {
    return;
  }
  try {
    field = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what()
              << "\n";
  }
}

// Counts land in std::size_t; a negative JSON integer would wrap.
void requireNonNegative(const nlohmann::json& doc, const char* key) {
  auto it = doc.find(key);
  if (it != doc.end() && it->is_number() && it->get<double>() < 0.0) {
    throw std::runtime_error(std::string("config: ") + key +
                             " must not be negative");
  }
}

void requireOrdered(double lo, double hi, const char* name) {
  if (lo > hi) {
    throw std::runtime_error(std::string("config: inverted range for ") +
                             name);
  }
}

void requireProbability(double p, const char* name) {
  if (p < 0.0 || p > 1.0) {
    throw std::runtime_error(std::string("config: ") + name +
                             " must lie in [0, 1]");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// loadSimulationConfig()
// -----------------------------------------------------------------------------
domain::SimulationConfig loadSimulationConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("config: cannot open " + path);
  }

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("config: invalid JSON in " + path + ": " +
                             e.what());
  }

  auto config = parseSimulationConfig(doc);
  std::cout << "[ConfigLoader] Loaded " << path << "\n";
  return config;
}

// -----------------------------------------------------------------------------
// parseSimulationConfig()
// -----------------------------------------------------------------------------
domain::SimulationConfig parseSimulationConfig(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw std::runtime_error("config: root must be a JSON object");
  }

  requireNonNegative(doc, "supplier_count");
  requireNonNegative(doc, "price_history_capacity");
  requireNonNegative(doc, "trend_window");

  domain::SimulationConfig c;

  overlay(doc, "supplier_count", c.supplier_count);

  overlay(doc, "initial_price_min", c.initial_price_min);
  overlay(doc, "initial_price_max", c.initial_price_max);
  overlay(doc, "history_daily_return", c.history_daily_return);
  overlay(doc, "min_price", c.min_price);
  overlay(doc, "max_price", c.max_price);
  overlay(doc, "price_history_capacity", c.price_history_capacity);
  overlay(doc, "trend_window", c.trend_window);
  overlay(doc, "trend_threshold", c.trend_threshold);
  overlay(doc, "price_noise", c.price_noise);
  overlay(doc, "factor_resample_probability", c.factor_resample_probability);
  overlay(doc, "forecast_resample_probability",
          c.forecast_resample_probability);

  overlay(doc, "dispatch_window_days", c.dispatch_window_days);
  overlay(doc, "ship_probability", c.ship_probability);
  overlay(doc, "delay_probability", c.delay_probability);
  overlay(doc, "min_delay_days", c.min_delay_days);
  overlay(doc, "max_delay_days", c.max_delay_days);
  overlay(doc, "resume_probability", c.resume_probability);

  overlay(doc, "supplier_drift_probability", c.supplier_drift_probability);
  overlay(doc, "score_drift", c.score_drift);
  overlay(doc, "capacity_drift", c.capacity_drift);
  overlay(doc, "min_score", c.min_score);
  overlay(doc, "max_score", c.max_score);

  overlay(doc, "fallback_contract_probability",
          c.fallback_contract_probability);
  overlay(doc, "min_contract_days", c.min_contract_days);
  overlay(doc, "max_contract_days", c.max_contract_days);
  overlay(doc, "fallback_order_probability", c.fallback_order_probability);
  overlay(doc, "min_delivery_lead_days", c.min_delivery_lead_days);
  overlay(doc, "max_delivery_lead_days", c.max_delivery_lead_days);

  validateSimulationConfig(c);
  return c;
}

// -----------------------------------------------------------------------------
// validateSimulationConfig()
// -----------------------------------------------------------------------------
void validateSimulationConfig(const domain::SimulationConfig& c) {
  requireOrdered(c.initial_price_min, c.initial_price_max, "initial_price");
  requireOrdered(c.min_price, c.max_price, "price");
  requireOrdered(c.min_score, c.max_score, "score");
  requireOrdered(c.min_delay_days, c.max_delay_days, "delay_days");
  requireOrdered(c.min_contract_days, c.max_contract_days, "contract_days");
  requireOrdered(c.min_delivery_lead_days, c.max_delivery_lead_days,
                 "delivery_lead_days");

  requireProbability(c.factor_resample_probability,
                     "factor_resample_probability");
  requireProbability(c.forecast_resample_probability,
                     "forecast_resample_probability");
  requireProbability(c.ship_probability, "ship_probability");
  requireProbability(c.delay_probability, "delay_probability");
  requireProbability(c.resume_probability, "resume_probability");
  requireProbability(c.supplier_drift_probability,
                     "supplier_drift_probability");
  requireProbability(c.fallback_contract_probability,
                     "fallback_contract_probability");
  requireProbability(c.fallback_order_probability,
                     "fallback_order_probability");
}

}  // namespace procure
