#pragma once
#include "application.hpp"
#include "explainer.hpp"
#include "model.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace credit {

// Outcome of one evaluation. Only assemble() creates one, so a report is
// always complete; it holds no reference back into the engine.
class DecisionReport {
public:
    const ApplicationInput& input() const { return input_; }
    const Prediction& prediction() const { return prediction_; }
    const std::vector<Contribution>& contributions() const { return explanation_.contributions; }
    const Explanation& explanation() const { return explanation_; }

private:
    DecisionReport(ApplicationInput input, Prediction prediction, Explanation explanation)
        : input_(std::move(input)), prediction_(prediction), explanation_(std::move(explanation)) {}

    friend DecisionReport assemble(const ApplicationInput&, const Prediction&, Explanation);

    ApplicationInput input_;
    Prediction prediction_;
    Explanation explanation_;
};

// Throws InvalidValueError instead of returning an incomplete report.
DecisionReport assemble(const ApplicationInput& input, const Prediction& prediction,
                        Explanation explanation);

nlohmann::json reportToJson(const DecisionReport& report);
std::string formatReport(const DecisionReport& report, std::size_t top_n);

} // namespace credit
