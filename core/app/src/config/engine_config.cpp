#include "depot/config/engine_config.hpp"
#include "depot/domain/errors.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <utility>

namespace depot {

namespace {

// Reads `key` from `object` into `out` when present. nlohmann's type_error
// is reported as ConfigError naming the key.
template <typename T>
void readOptional(const nlohmann::json& object, const char* key, T& out) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Invalid value for '") + key +
                      "': " + e.what());
  }
}

template <typename T>
T readRequired(const nlohmann::json& object, const char* key,
               const char* context) {
  auto it = object.find(key);
  if (it == object.end()) {
    throw ConfigError(std::string("Missing '") + key + "' in " + context);
  }
  try {
    return it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Invalid value for '") + key + "' in " +
                      context + ": " + e.what());
  }
}

const nlohmann::json* section(const nlohmann::json& document, const char* key,
                              nlohmann::json::value_t expected) {
  auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    return nullptr;
  }
  if (it->type() != expected) {
    throw ConfigError(std::string("Section '") + key + "' has the wrong type");
  }
  return &*it;
}

void requireNonNegative(double value, const char* name) {
  if (value < 0.0) {
    throw ConfigError(std::string(name) + " must be >= 0, got " +
                      std::to_string(value));
  }
}

void requireFraction(double value, const char* name) {
  if (value < 0.0 || value > 1.0) {
    throw ConfigError(std::string(name) + " must lie in [0, 1], got " +
                      std::to_string(value));
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// parseEngineConfig: JSON document → validated EngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ConfigError("Configuration root must be a JSON object");
  }

  EngineConfig config;

  if (auto* approval =
          section(document, "approval", nlohmann::json::value_t::object)) {
    readOptional(*approval, "value_threshold", config.approval.value_threshold);
    readOptional(*approval, "quantity_threshold",
                 config.approval.quantity_threshold);

    std::string mode_name;
    readOptional(*approval, "mode", mode_name);
    if (!mode_name.empty() &&
        !domain::parseOperationMode(mode_name.c_str(), config.approval.mode)) {
      throw ConfigError("Unknown approval mode '" + mode_name +
                        "' (expected autonomous or supervised)");
    }
  }
  requireNonNegative(config.approval.value_threshold,
                     "approval.value_threshold");
  requireNonNegative(static_cast<double>(config.approval.quantity_threshold),
                     "approval.quantity_threshold");

  if (auto* policy =
          section(document, "policy", nlohmann::json::value_t::object)) {
    readOptional(*policy, "source_retain_fraction",
                 config.policy.source_retain_fraction);
    readOptional(*policy, "alternative_quantity_fraction",
                 config.policy.alternative_quantity_fraction);
  }
  requireFraction(config.policy.source_retain_fraction,
                  "policy.source_retain_fraction");
  requireFraction(config.policy.alternative_quantity_fraction,
                  "policy.alternative_quantity_fraction");

  readOptional(document, "lock_timeout_ms", config.lock_timeout_ms);
  requireNonNegative(static_cast<double>(config.lock_timeout_ms),
                     "lock_timeout_ms");

  if (auto* prices =
          section(document, "prices", nlohmann::json::value_t::object)) {
    for (const auto& item : prices->items()) {
      const std::string& sku = item.key();
      const nlohmann::json& value = item.value();
      if (!value.is_number()) {
        throw ConfigError("Price of " + sku + " must be a number");
      }
      const double price = value.get<double>();
      requireNonNegative(price, "prices entry");
      config.prices[sku] = price;
    }
  }

  if (auto* stock = section(document, "stock", nlohmann::json::value_t::array)) {
    for (const auto& row : *stock) {
      StockSeed seed;
      seed.warehouse_id = readRequired<std::string>(row, "warehouse_id", "stock");
      seed.sku = readRequired<std::string>(row, "sku", "stock");
      seed.quantity = readRequired<domain::Quantity>(row, "quantity", "stock");
      requireNonNegative(static_cast<double>(seed.quantity), "stock.quantity");
      config.stock.push_back(std::move(seed));
    }
  }

  if (auto* watch = section(document, "watch", nlohmann::json::value_t::array)) {
    for (const auto& row : *watch) {
      WatchEntry entry;
      entry.warehouse_id = readRequired<std::string>(row, "warehouse_id", "watch");
      entry.sku = readRequired<std::string>(row, "sku", "watch");
      entry.threshold = readRequired<domain::Quantity>(row, "threshold", "watch");
      requireNonNegative(static_cast<double>(entry.threshold), "watch.threshold");
      config.watch.push_back(std::move(entry));
    }
  }

  if (auto* totals = section(document, "expected_totals",
                             nlohmann::json::value_t::object)) {
    for (const auto& item : totals->items()) {
      const std::string& sku = item.key();
      const nlohmann::json& value = item.value();
      if (!value.is_number_integer()) {
        throw ConfigError("Expected total of " + sku + " must be an integer");
      }
      config.expected_totals[sku] = value.get<domain::Quantity>();
    }
  }

  return config;
}

EngineConfig parseEngineConfigText(const std::string& text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("Malformed configuration JSON: ") + e.what());
  }
  return parseEngineConfig(document);
}

// -----------------------------------------------------------------------------
// loadEngineConfigFromFile
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfigFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open configuration file: " + path);
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("Malformed configuration file " + path + ": " + e.what());
  }

  std::cout << "[EngineConfig] Loaded " << path << "\n";
  return parseEngineConfig(document);
}

}  // namespace depot
