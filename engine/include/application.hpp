#pragma once
#include <initializer_list>
#include <map>
#include <string>
#include <utility>

namespace credit {

// Raw feature values for one evaluation, keyed by feature name.
// Categorical fields arrive already encoded as numbers.
class ApplicationInput {
public:
    using Fields = std::map<std::string, double>;

    ApplicationInput() = default;
    explicit ApplicationInput(Fields fields) : fields_(std::move(fields)) {}
    ApplicationInput(std::initializer_list<Fields::value_type> init) : fields_(init) {}

    bool has(const std::string& name) const { return fields_.count(name) != 0; }
    double at(const std::string& name) const;   // throws MissingFeatureError
    const Fields& fields() const { return fields_; }
    std::size_t size() const { return fields_.size(); }

private:
    Fields fields_;
};

enum class Liquidity { Low = 1, Medium = 2, High = 3 };

// Form fields of the credit simulator before feature derivation.
struct CreditRequest {
    double monthly_income{};
    double age{};
    double credit_amount{};
    double guarantee_value{};
    Liquidity liquidity{Liquidity::Low};
};

// Accepts "low"/"medium"/"high" and the legacy "baixa"/"media"/"alta".
Liquidity parseLiquidity(const std::string& text);
const char* liquidityName(Liquidity l);

// Derives the eight trained credit features from the raw form fields.
ApplicationInput buildApplication(const CreditRequest& req);

} // namespace credit
