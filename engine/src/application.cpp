#include "application.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace credit {

double ApplicationInput::at(const std::string& name) const {
    auto it = fields_.find(name);
    if (it == fields_.end()) throw MissingFeatureError({name});
    return it->second;
}

Liquidity parseLiquidity(const std::string& text) {
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "low" || t == "baixa") return Liquidity::Low;
    if (t == "medium" || t == "media") return Liquidity::Medium;
    if (t == "high" || t == "alta") return Liquidity::High;
    throw InvalidValueError("Unknown guarantee liquidity '" + text + "' (expected low, medium or high)");
}

const char* liquidityName(Liquidity l) {
    switch (l) {
        case Liquidity::Low:    return "low";
        case Liquidity::Medium: return "medium";
        case Liquidity::High:   return "high";
    }
    return "unknown";
}

ApplicationInput buildApplication(const CreditRequest& req) {
    const double inputs[] = {req.monthly_income, req.age, req.credit_amount, req.guarantee_value};
    for (double v : inputs) {
        if (!std::isfinite(v)) throw InvalidValueError("Credit request contains a non-finite value");
    }
    if (req.credit_amount < 0.0) throw InvalidValueError("credit_amount must be non-negative");
    if (req.age < 0.0) throw InvalidValueError("age must be non-negative");

    const double liquidity_score = static_cast<double>(static_cast<int>(req.liquidity));
    // +1 keeps the ratios defined at zero credit or age
    const double ratio = req.guarantee_value / (req.credit_amount + 1.0);

    return ApplicationInput{
        {"monthly_income", req.monthly_income},
        {"age", req.age},
        {"credit_amount", req.credit_amount},
        {"guarantee_value", req.guarantee_value},
        {"guarantee_credit_ratio", ratio},
        {"liquidity_score", liquidity_score},
        {"income_per_age", req.monthly_income / (req.age + 1.0)},
        {"weighted_guarantee", ratio * liquidity_score},
    };
}

} // namespace credit
