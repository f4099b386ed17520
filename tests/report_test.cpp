#include "report.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <cmath>
#include <gtest/gtest.h>

using namespace credit;

namespace {

Explanation unsortedExplanation() {
    Explanation ex;
    ex.method = ExplanationMethod::Analytic;
    ex.output = 0.8;
    ex.baseline_output = 0.0;
    ex.contributions = {{"income", 0, 0.15, false}, {"credit_amount", 1, 0.2, false},
                        {"guarantee_value", 2, 0.5, false}, {"age", 3, -0.05, false}};
    return ex;
}

Prediction approved() {
    return Prediction{Decision::Approved, 1.0 / (1.0 + std::exp(-0.8)), 0.8};
}

} // namespace

TEST(ReportTest, AssembleRanksAndEchoesInput) {
    const auto input = test::toyApplication();
    const DecisionReport r = assemble(input, approved(), unsortedExplanation());

    EXPECT_EQ(r.prediction().label, Decision::Approved);
    EXPECT_EQ(r.input().fields(), input.fields());
    ASSERT_EQ(r.contributions().size(), 4u);
    EXPECT_EQ(r.contributions()[0].feature, "guarantee_value");
    EXPECT_EQ(r.contributions()[3].feature, "age");
    EXPECT_EQ(r.explanation().method, ExplanationMethod::Analytic);
}

TEST(ReportTest, RefusesIncompleteReports) {
    const auto input = test::toyApplication();

    Explanation empty = unsortedExplanation();
    empty.contributions.clear();
    EXPECT_THROW(assemble(input, approved(), empty), InvalidValueError);

    Prediction bad = approved();
    bad.probability = std::nan("");
    EXPECT_THROW(assemble(input, bad, unsortedExplanation()), InvalidValueError);
    bad.probability = 1.2;
    EXPECT_THROW(assemble(input, bad, unsortedExplanation()), InvalidValueError);

    Explanation inf = unsortedExplanation();
    inf.contributions[1].score = INFINITY;
    EXPECT_THROW(assemble(input, approved(), inf), InvalidValueError);

    EXPECT_THROW(assemble(ApplicationInput{}, approved(), unsortedExplanation()), InvalidValueError);
}

TEST(ReportTest, JsonCarriesDecisionContributionsAndInput) {
    const DecisionReport r = assemble(test::toyApplication(), approved(), unsortedExplanation());
    const auto j = reportToJson(r);

    EXPECT_EQ(j.at("decision"), "approved");
    EXPECT_NEAR(j.at("probability").get<double>(), r.prediction().probability, 1e-12);
    EXPECT_EQ(j.at("explanation").at("method"), "analytic");
    ASSERT_EQ(j.at("contributions").size(), 4u);
    EXPECT_EQ(j.at("contributions")[0].at("feature"), "guarantee_value");
    EXPECT_EQ(j.at("contributions")[0].at("index"), 2);
    EXPECT_DOUBLE_EQ(j.at("input").at("credit_amount").get<double>(), 20000.0);
}

TEST(ReportTest, TextNamesTheTopDrivers) {
    Explanation ex = unsortedExplanation();
    ex.contributions[3].zero_variance = true;
    ex.contributions[3].score = 0.0;
    ex.diagnostics.push_back("zero_variance:age");
    const DecisionReport r = assemble(test::toyApplication(), approved(), ex);

    const std::string text = formatReport(r, 2);
    EXPECT_NE(text.find("APPROVED"), std::string::npos);
    EXPECT_NE(text.find("guarantee_value"), std::string::npos);
    EXPECT_NE(text.find("raises approval"), std::string::npos);
    EXPECT_EQ(text.find("income "), std::string::npos);   // beyond top 2
    EXPECT_NE(text.find("Flagged: zero_variance:age"), std::string::npos);
}
