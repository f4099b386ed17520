#pragma once
#include "feature_schema.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace credit {

enum class Decision { Approved, Denied };
const char* decisionName(Decision d);

struct Prediction {
    Decision label{Decision::Denied};
    double probability{};   // P(approved), 0..1
    double score{};         // logit for linear models, probability otherwise
};

// Coefficients of a model that is linear in logit space.
struct LinearTerms {
    std::vector<double> coef;
    double intercept{};

    double logit(const NormalizedVector& x) const;
};

// Scoring capability shared by every model family. Implementations are
// immutable after construction and safe to call from many threads.
class DecisionModel {
public:
    virtual ~DecisionModel() = default;

    virtual const char* family() const = 0;
    virtual std::size_t featureCount() const = 0;
    // Probability of the approved class. Throws DimensionMismatchError.
    virtual double score(const NormalizedVector& x) const = 0;
    // Raw output before the link function; probability for non-linear models.
    virtual double rawScore(const NormalizedVector& x) const { return score(x); }
    // Non-null only for models that admit exact analytic attribution.
    virtual const LinearTerms* linearTerms() const { return nullptr; }
};

class LogisticModel : public DecisionModel {
public:
    explicit LogisticModel(LinearTerms terms);

    const char* family() const override { return "logistic"; }
    std::size_t featureCount() const override { return terms_.coef.size(); }
    double score(const NormalizedVector& x) const override;
    double rawScore(const NormalizedVector& x) const override;
    const LinearTerms* linearTerms() const override { return &terms_; }

private:
    LinearTerms terms_;
};

struct TreeNode {
    int feature{-1};
    double threshold{};
    int left{-1};
    int right{-1};
    double p_approved{};    // leaves only
    bool leaf() const { return left < 0 && right < 0; }
};

struct DecisionTree {
    std::vector<TreeNode> nodes;   // node 0 is the root
};

// Random forest export: probability is the mean approved-class probability
// over the leaves reached in every tree.
class ForestModel : public DecisionModel {
public:
    ForestModel(std::size_t feature_count, std::vector<DecisionTree> trees);

    const char* family() const override { return "random_forest"; }
    std::size_t featureCount() const override { return feature_count_; }
    double score(const NormalizedVector& x) const override;

    std::size_t treeCount() const { return trees_.size(); }

private:
    std::size_t feature_count_;
    std::vector<DecisionTree> trees_;
};

// A trained model together with the feature order it was trained on.
struct ModelArtifact {
    std::shared_ptr<const DecisionModel> model;
    std::vector<std::string> features;
    double threshold{0.5};
    std::string version;
};

double sigmoid(double z);

Prediction predict(const NormalizedVector& x, const DecisionModel& model, double threshold);
Prediction predict(const NormalizedVector& x, const ModelArtifact& artifact);

} // namespace credit
