#include "model.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <cmath>
#include <limits>
#include <gtest/gtest.h>

using namespace credit;

static const NormalizedVector kToyVector{0.5, -0.5, 1.0, -0.5};

TEST(ModelTest, LogisticProbabilityIsSigmoidOfWeightedSum) {
    const auto artifact = test::toyLinearArtifact();
    const Prediction p = predict(kToyVector, artifact);
    EXPECT_NEAR(p.score, 0.8, 1e-12);
    EXPECT_NEAR(p.probability, 1.0 / (1.0 + std::exp(-0.8)), 1e-12);
    EXPECT_EQ(p.label, Decision::Approved);
}

TEST(ModelTest, PredictIsDeterministic) {
    const auto artifact = test::toyForestArtifact();
    const Prediction a = predict(kToyVector, artifact);
    const Prediction b = predict(kToyVector, artifact);
    EXPECT_EQ(a.label, b.label);
    EXPECT_EQ(a.probability, b.probability);
    EXPECT_EQ(a.score, b.score);
}

TEST(ModelTest, ThresholdDecidesTheLabel) {
    const auto artifact = test::toyLinearArtifact();
    EXPECT_EQ(predict(kToyVector, *artifact.model, 0.5).label, Decision::Approved);
    EXPECT_EQ(predict(kToyVector, *artifact.model, 0.7).label, Decision::Denied);
    // the boundary itself approves
    const double p = artifact.model->score(kToyVector);
    EXPECT_EQ(predict(kToyVector, *artifact.model, p).label, Decision::Approved);
}

TEST(ModelTest, WrongLengthRaisesDimensionMismatch) {
    const auto artifact = test::toyLinearArtifact();
    try {
        predict(NormalizedVector{0.1, 0.2, 0.3}, artifact);
        FAIL() << "expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(e.expected(), 4u);
        EXPECT_EQ(e.actual(), 3u);
    }
    EXPECT_THROW(predict(NormalizedVector(5, 0.0), test::toyForestArtifact()), DimensionMismatchError);
}

TEST(ModelTest, ForestAveragesLeafProbabilities) {
    const auto artifact = test::toyForestArtifact();
    EXPECT_DOUBLE_EQ(artifact.model->score(kToyVector), 0.875);
    EXPECT_DOUBLE_EQ(artifact.model->score(NormalizedVector(4, 0.0)), 0.375);
    EXPECT_EQ(artifact.model->linearTerms(), nullptr);
}

TEST(ModelTest, EmptyArtifactRefusesToPredict) {
    ModelArtifact empty;
    EXPECT_THROW(predict(kToyVector, empty), ArtifactLoadError);
}

TEST(ModelTest, NonFiniteProbabilityIsRejected) {
    const double inf = std::numeric_limits<double>::infinity();
    const LogisticModel broken(LinearTerms{{inf, -inf, 0.0, 0.0}, 0.0});
    EXPECT_THROW(predict(NormalizedVector{1.0, 1.0, 0.0, 0.0}, broken, 0.5), InvalidValueError);
}

namespace {

TreeNode node(int feature, int left, int right) {
    TreeNode n;
    n.feature = feature;
    n.left = left;
    n.right = right;
    return n;
}

TreeNode leafNode(double p) {
    TreeNode n;
    n.p_approved = p;
    return n;
}

} // namespace

TEST(ModelTest, ForestRejectsBrokenTopology) {
    EXPECT_THROW(ForestModel(4, {}), ArtifactLoadError);
    EXPECT_THROW(ForestModel(4, {DecisionTree{}}), ArtifactLoadError);
    // feature index past the schema width
    EXPECT_THROW(ForestModel(4, {DecisionTree{{node(4, 1, 2), leafNode(0.2), leafNode(0.8)}}}),
                 ArtifactLoadError);
    // child pointing back at its parent would loop forever
    EXPECT_THROW(ForestModel(4, {DecisionTree{{node(0, 1, 2), node(1, 0, 2), leafNode(0.8)}}}),
                 ArtifactLoadError);
    // child index past the node list
    EXPECT_THROW(ForestModel(4, {DecisionTree{{node(0, 1, 3), leafNode(0.2), leafNode(0.8)}}}),
                 ArtifactLoadError);
    EXPECT_THROW(ForestModel(4, {DecisionTree{{leafNode(1.5)}}}), ArtifactLoadError);

    TreeNode nan_split = node(0, 1, 2);
    nan_split.threshold = std::nan("");
    EXPECT_THROW(ForestModel(4, {DecisionTree{{nan_split, leafNode(0.2), leafNode(0.8)}}}),
                 ArtifactLoadError);

    const ForestModel stump(4, {DecisionTree{{leafNode(0.6)}}});
    EXPECT_EQ(stump.treeCount(), 1u);
    EXPECT_DOUBLE_EQ(stump.score(NormalizedVector(4, 0.0)), 0.6);
}
