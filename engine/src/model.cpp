#include "model.hpp"
#include "errors.hpp"
#include <cmath>

namespace credit {

const char* decisionName(Decision d) {
    return d == Decision::Approved ? "approved" : "denied";
}

double sigmoid(double z) {
    return 1.0 / (1.0 + std::exp(-z));
}

double LinearTerms::logit(const NormalizedVector& x) const {
    if (x.size() != coef.size()) throw DimensionMismatchError(coef.size(), x.size());
    double z = intercept;
    for (std::size_t i = 0; i < coef.size(); ++i) z += coef[i] * x[i];
    return z;
}

LogisticModel::LogisticModel(LinearTerms terms) : terms_(std::move(terms)) {}

double LogisticModel::score(const NormalizedVector& x) const {
    return sigmoid(terms_.logit(x));
}

double LogisticModel::rawScore(const NormalizedVector& x) const {
    return terms_.logit(x);
}

ForestModel::ForestModel(std::size_t feature_count, std::vector<DecisionTree> trees)
    : feature_count_(feature_count), trees_(std::move(trees)) {
    if (trees_.empty()) throw ArtifactLoadError("Forest has no trees");
    for (const auto& t : trees_) {
        const int n = static_cast<int>(t.nodes.size());
        if (n == 0) throw ArtifactLoadError("Forest tree has no nodes");
        for (int i = 0; i < n; ++i) {
            const auto& nd = t.nodes[i];
            if (nd.leaf()) {
                if (!(nd.p_approved >= 0.0 && nd.p_approved <= 1.0)) {
                    throw ArtifactLoadError("Leaf " + std::to_string(i) + " probability outside [0, 1]");
                }
                continue;
            }
            if (nd.feature < 0 || static_cast<std::size_t>(nd.feature) >= feature_count_) {
                throw ArtifactLoadError("Tree node references feature " + std::to_string(nd.feature) + " out of range");
            }
            if (!std::isfinite(nd.threshold)) {
                throw ArtifactLoadError("Tree node " + std::to_string(i) + " has a non-finite threshold");
            }
            // children must come after the parent so traversal always terminates
            const auto childOk = [&](int c) { return c > i && c < n; };
            if (!childOk(nd.left) || !childOk(nd.right)) {
                throw ArtifactLoadError("Tree node " + std::to_string(i) + " has invalid children");
            }
        }
    }
}

double ForestModel::score(const NormalizedVector& x) const {
    if (x.size() != feature_count_) throw DimensionMismatchError(feature_count_, x.size());
    double acc = 0.0;
    for (const auto& t : trees_) {
        int i = 0;
        // the constructor guarantees children follow their parent
        while (!t.nodes[i].leaf()) {
            const auto& nd = t.nodes[i];
            i = (x[nd.feature] <= nd.threshold) ? nd.left : nd.right;
        }
        acc += t.nodes[i].p_approved;
    }
    return acc / static_cast<double>(trees_.size());
}

Prediction predict(const NormalizedVector& x, const DecisionModel& model, double threshold) {
    if (x.size() != model.featureCount()) {
        throw DimensionMismatchError(model.featureCount(), x.size());
    }
    Prediction p;
    p.probability = model.score(x);
    if (!std::isfinite(p.probability) || p.probability < 0.0 || p.probability > 1.0) {
        throw InvalidValueError(std::string(model.family()) + " model produced no valid probability");
    }
    p.score = model.rawScore(x);
    p.label = (p.probability >= threshold) ? Decision::Approved : Decision::Denied;
    return p;
}

Prediction predict(const NormalizedVector& x, const ModelArtifact& artifact) {
    if (!artifact.model) throw ArtifactLoadError("No model loaded");
    return predict(x, *artifact.model, artifact.threshold);
}

} // namespace credit
