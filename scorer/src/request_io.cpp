#include "request_io.hpp"
#include "errors.hpp"
#include <fstream>
#include <vector>

using json = nlohmann::json;

namespace credit {

static double numberField(const json& j, const char* key) {
  const auto& v = j.at(key);
  if (!v.is_number()) throw InvalidValueError(std::string("Field '") + key + "' must be a number");
  return v.get<double>();
}

CreditRequest creditRequestFromJson(const json& j) {
  const char* required[] = {"monthly_income", "age", "credit_amount", "guarantee_value", "guarantee_liquidity"};
  std::vector<std::string> missing;
  for (auto key : required) {
    if (!j.contains(key)) missing.push_back(key);
  }
  if (!missing.empty()) throw MissingFeatureError(std::move(missing));

  CreditRequest req;
  req.monthly_income  = numberField(j, "monthly_income");
  req.age             = numberField(j, "age");
  req.credit_amount   = numberField(j, "credit_amount");
  req.guarantee_value = numberField(j, "guarantee_value");
  const auto& liq = j.at("guarantee_liquidity");
  if (!liq.is_string()) throw InvalidValueError("Field 'guarantee_liquidity' must be a string");
  req.liquidity = parseLiquidity(liq.get<std::string>());
  return req;
}

ApplicationInput applicationFromJson(const json& j) {
  if (!j.is_object()) throw InvalidValueError("Application must be a JSON object");
  if (j.contains("guarantee_liquidity")) return buildApplication(creditRequestFromJson(j));

  ApplicationInput::Fields fields;
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!it.value().is_number()) {
      throw InvalidValueError("Field '" + it.key() + "' must be a number");
    }
    fields[it.key()] = it.value().get<double>();
  }
  return ApplicationInput(std::move(fields));
}

ApplicationInput readApplicationFile(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    throw std::runtime_error("Could not open application file: " + path);
  }
  json j;
  try {
    f >> j;
  } catch (const json::exception& e) {
    throw InvalidValueError("Malformed application JSON in " + path + ": " + e.what());
  }
  return applicationFromJson(j);
}

} // namespace credit
