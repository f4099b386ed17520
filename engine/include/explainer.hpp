#pragma once
#include "engine_config.hpp"
#include "feature_schema.hpp"
#include "model.hpp"
#include <string>
#include <vector>

namespace credit {

struct Contribution {
    std::string feature;
    std::size_t index{};        // position in the schema
    double score{};             // signed effect relative to the baseline
    bool zero_variance{false};  // forced to 0, see Explanation::diagnostics
};

struct Explanation {
    ExplanationMethod method{ExplanationMethod::Analytic};  // never Auto
    std::vector<Contribution> contributions;  // ranked, see rankContributions
    double output{};            // logit (analytic) or probability (perturbation)
    double baseline_output{};   // same space, evaluated at the baseline vector
    std::vector<std::string> diagnostics;
};

// Decomposes the model output for `x` into per-feature contributions against
// the schema baseline.
//
// Analytic attribution is used when the model exposes linear terms (unless
// the config forces perturbation); contributions then sum exactly to
// output - baseline_output. Otherwise each feature is replaced by its baseline
// value and the model re-scored, which costs one inference per feature.
//
// Throws DimensionMismatchError, ExplanationUnsupportedError and
// ExplanationTimeoutError.
Explanation explain(const DecisionModel& model, const NormalizedVector& x,
                    const FeatureSchema& schema, const EngineConfig& cfg);

// Sorts by descending |score|; equal magnitudes keep schema order.
void rankContributions(std::vector<Contribution>& contributions);

} // namespace credit
