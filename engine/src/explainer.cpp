#include "explainer.hpp"
#include "errors.hpp"
#include "normalizer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace credit {

void rankContributions(std::vector<Contribution>& contributions) {
    std::sort(contributions.begin(), contributions.end(),
              [](const Contribution& a, const Contribution& b) {
                  const double ma = std::fabs(a.score);
                  const double mb = std::fabs(b.score);
                  if (ma != mb) return ma > mb;
                  return a.index < b.index;
              });
}

static void flagZeroVariance(Explanation& ex, const FeatureSchema& schema, std::size_t i) {
    ex.contributions[i].zero_variance = true;
    ex.contributions[i].score = 0.0;
    ex.diagnostics.push_back("zero_variance:" + schema.features[i].name);
}

static Explanation seed(const FeatureSchema& schema, ExplanationMethod method) {
    Explanation ex;
    ex.method = method;
    ex.contributions.reserve(schema.size());
    for (std::size_t i = 0; i < schema.size(); ++i) {
        ex.contributions.push_back(Contribution{schema.features[i].name, i, 0.0, false});
    }
    return ex;
}

static Explanation explainLinear(const LinearTerms& terms, const NormalizedVector& x,
                                 const NormalizedVector& base, const FeatureSchema& schema) {
    Explanation ex = seed(schema, ExplanationMethod::Analytic);
    ex.output = terms.logit(x);
    ex.baseline_output = terms.logit(base);
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (schema.zeroVariance(i)) {
            flagZeroVariance(ex, schema, i);
            continue;
        }
        ex.contributions[i].score = terms.coef[i] * (x[i] - base[i]);
    }
    return ex;
}

static Explanation explainPerturbation(const DecisionModel& model, const NormalizedVector& x,
                                       const NormalizedVector& base, const FeatureSchema& schema,
                                       const EngineConfig& cfg) {
    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    const auto deadline_hit = [&]() {
        return cfg.perturbation_timeout.count() > 0 &&
               clock::now() - start > cfg.perturbation_timeout;
    };
    const auto timeout_error = [&](std::size_t done) {
        return ExplanationTimeoutError(
            "Perturbation explanation exceeded " + std::to_string(cfg.perturbation_timeout.count()) +
            " ms after " + std::to_string(done) + " of " + std::to_string(x.size()) + " features");
    };

    Explanation ex = seed(schema, ExplanationMethod::Perturbation);
    ex.output = model.score(x);
    ex.baseline_output = model.score(base);
    if (deadline_hit()) throw timeout_error(0);

    NormalizedVector probe = x;
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (schema.zeroVariance(i)) {
            flagZeroVariance(ex, schema, i);
            continue;
        }
        probe[i] = base[i];
        ex.contributions[i].score = ex.output - model.score(probe);
        probe[i] = x[i];
        if (deadline_hit()) throw timeout_error(i + 1);
    }
    return ex;
}

Explanation explain(const DecisionModel& model, const NormalizedVector& x,
                    const FeatureSchema& schema, const EngineConfig& cfg) {
    if (x.size() != model.featureCount()) throw DimensionMismatchError(model.featureCount(), x.size());
    if (schema.size() != x.size()) throw DimensionMismatchError(schema.size(), x.size());

    const NormalizedVector base = baselineVector(schema);
    const LinearTerms* terms = model.linearTerms();

    Explanation ex;
    if (terms && cfg.method != ExplanationMethod::Perturbation) {
        ex = explainLinear(*terms, x, base, schema);
    } else if (cfg.method == ExplanationMethod::Analytic) {
        throw ExplanationUnsupportedError(std::string("Analytic explanation needs a linear model, got ") +
                                          model.family());
    } else {
        const std::size_t calls = x.size() + 2;
        if (cfg.max_perturbation_calls > 0 && calls > cfg.max_perturbation_calls) {
            throw ExplanationUnsupportedError(
                "Perturbation explanation needs " + std::to_string(calls) +
                " inferences, budget is " + std::to_string(cfg.max_perturbation_calls));
        }
        ex = explainPerturbation(model, x, base, schema, cfg);
    }
    rankContributions(ex.contributions);
    return ex;
}

} // namespace credit
