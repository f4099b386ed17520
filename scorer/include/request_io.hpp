#pragma once
#include "application.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace credit {

// Form payload: {"monthly_income", "age", "credit_amount", "guarantee_value",
// "guarantee_liquidity"}. Throws MissingFeatureError / InvalidValueError.
CreditRequest creditRequestFromJson(const nlohmann::json& j);

// A payload carrying "guarantee_liquidity" is treated as a credit form and
// expanded into derived features; any other object is taken as a flat
// name -> number map.
ApplicationInput applicationFromJson(const nlohmann::json& j);
ApplicationInput readApplicationFile(const std::string& path);

} // namespace credit
