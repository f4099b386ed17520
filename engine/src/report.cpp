#include "report.hpp"
#include "errors.hpp"
#include <cmath>
#include <cstdio>
#include <sstream>

using json = nlohmann::json;

namespace credit {

DecisionReport assemble(const ApplicationInput& input, const Prediction& prediction,
                        Explanation explanation) {
    if (input.size() == 0) throw InvalidValueError("Cannot report on an empty application");
    if (!std::isfinite(prediction.probability) || prediction.probability < 0.0 ||
        prediction.probability > 1.0) {
        throw InvalidValueError("Prediction probability is not in [0, 1]");
    }
    if (explanation.contributions.empty()) throw InvalidValueError("Explanation has no contributions");
    for (const auto& c : explanation.contributions) {
        if (!std::isfinite(c.score)) {
            throw InvalidValueError("Contribution for '" + c.feature + "' is not finite");
        }
    }
    rankContributions(explanation.contributions);
    return DecisionReport(input, prediction, std::move(explanation));
}

json reportToJson(const DecisionReport& report) {
    const auto& p = report.prediction();
    const auto& ex = report.explanation();

    json contributions = json::array();
    for (const auto& c : ex.contributions) {
        contributions.push_back({
            {"feature", c.feature},
            {"index", c.index},
            {"score", c.score},
            {"zero_variance", c.zero_variance},
        });
    }

    json j;
    j["decision"] = decisionName(p.label);
    j["probability"] = p.probability;
    j["score"] = p.score;
    j["explanation"] = {
        {"method", methodName(ex.method)},
        {"output", ex.output},
        {"baseline_output", ex.baseline_output},
        {"diagnostics", ex.diagnostics},
    };
    j["contributions"] = std::move(contributions);
    j["input"] = report.input().fields();
    return j;
}

std::string formatReport(const DecisionReport& report, std::size_t top_n) {
    const auto& p = report.prediction();
    const auto& ex = report.explanation();
    const bool approved = p.label == Decision::Approved;
    const char* space = ex.method == ExplanationMethod::Analytic ? "logit" : "probability";

    std::ostringstream out;
    char line[256];
    std::snprintf(line, sizeof(line), "Credit %s | approval probability %.2f%%\n",
                  approved ? "APPROVED" : "DENIED", p.probability * 100.0);
    out << line;
    std::snprintf(line, sizeof(line), "Explanation: %s, %s %.4f vs baseline %.4f\n",
                  methodName(ex.method), space, ex.output, ex.baseline_output);
    out << line;

    const std::size_t n = (top_n == 0 || top_n > ex.contributions.size()) ? ex.contributions.size() : top_n;
    out << "Top drivers:\n";
    for (std::size_t i = 0; i < n; ++i) {
        const auto& c = ex.contributions[i];
        const char* effect = c.zero_variance ? "no effect (zero variance)"
                           : c.score > 0.0   ? "raises approval"
                           : c.score < 0.0   ? "lowers approval"
                                             : "no effect";
        std::snprintf(line, sizeof(line), "  %2zu. %-24s %+.4f  %s\n", i + 1, c.feature.c_str(),
                      c.score, effect);
        out << line;
    }
    for (const auto& d : ex.diagnostics) out << "Flagged: " << d << "\n";
    return out.str();
}

} // namespace credit
