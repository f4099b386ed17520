#include "test_support.hpp"

namespace credit::test {

static FeatureSpec standard(const char* name, double mean, double scale) {
    FeatureSpec f;
    f.name = name;
    f.center = mean;
    f.scale = scale;
    f.baseline = mean;
    return f;
}

FeatureSchema toySchema() {
    FeatureSchema s;
    s.version = "toy-1";
    s.features.push_back(standard("income", 4000.0, 2000.0));
    s.features.push_back(standard("credit_amount", 25000.0, 10000.0));
    s.features.push_back(standard("guarantee_value", 10000.0, 5000.0));
    s.features.push_back(standard("age", 40.0, 10.0));
    s.features[1].lower = 0.0;
    return s;
}

ApplicationInput toyApplication() {
    return ApplicationInput{
        {"income", 5000.0}, {"credit_amount", 20000.0}, {"guarantee_value", 15000.0}, {"age", 35.0}};
}

ModelArtifact toyLinearArtifact(double bias) {
    ModelArtifact m;
    m.model = std::make_shared<LogisticModel>(LinearTerms{{0.3, -0.4, 0.5, 0.1}, bias});
    m.features = {"income", "credit_amount", "guarantee_value", "age"};
    m.threshold = 0.5;
    m.version = "toy-linear";
    return m;
}

static TreeNode split(int feature, double threshold) {
    TreeNode n;
    n.feature = feature;
    n.threshold = threshold;
    n.left = 1;
    n.right = 2;
    return n;
}

static TreeNode leaf(double p) {
    TreeNode n;
    n.p_approved = p;
    return n;
}

ModelArtifact toyForestArtifact() {
    DecisionTree income{{split(0, 0.0), leaf(0.25), leaf(0.75)}};
    DecisionTree guarantee{{split(2, 0.5), leaf(0.5), leaf(1.0)}};
    ModelArtifact m;
    m.model = std::make_shared<ForestModel>(4, std::vector<DecisionTree>{income, guarantee});
    m.features = {"income", "credit_amount", "guarantee_value", "age"};
    m.threshold = 0.5;
    m.version = "toy-forest";
    return m;
}

std::string toyModelJson() {
    return R"({
      "family": "logistic",
      "version": "toy-linear",
      "features": ["income", "credit_amount", "guarantee_value", "age"],
      "coef": [0.3, -0.4, 0.5, 0.1],
      "intercept": 0.0,
      "decision_threshold": 0.5
    })";
}

std::string toySchemaJson() {
    return R"({
      "version": "toy-1",
      "scaling": "standard",
      "features": [
        {"name": "income", "mean": 4000, "scale": 2000},
        {"name": "credit_amount", "mean": 25000, "scale": 10000, "lower": 0},
        {"name": "guarantee_value", "mean": 10000, "scale": 5000},
        {"name": "age", "mean": 40, "scale": 10}
      ]
    })";
}

} // namespace credit::test
