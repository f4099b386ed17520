#include "request_io.hpp"
#include "credit_engine.hpp"
#include "errors.hpp"
#include "history_io.hpp"
#include "model_loader.hpp"
#include <gtest/gtest.h>

using namespace credit;
using json = nlohmann::json;

namespace {

const char* kFormSchema = R"({"version": "form-1", "features": [
  {"name": "monthly_income", "mean": 8200, "scale": 5100, "lower": 0},
  {"name": "age", "mean": 41, "scale": 12.5, "lower": 18, "upper": 90},
  {"name": "credit_amount", "mean": 92000, "scale": 81000, "lower": 0},
  {"name": "guarantee_value", "mean": 140000, "scale": 120000, "lower": 0},
  {"name": "guarantee_credit_ratio", "mean": 1.9, "scale": 1.4},
  {"name": "liquidity_score", "mean": 2, "scale": 0.8},
  {"name": "income_per_age", "mean": 205, "scale": 140},
  {"name": "weighted_guarantee", "mean": 3.9, "scale": 3.1}]})";

const char* kFormModel = R"({"family": "logistic", "version": "form-1",
  "features": ["monthly_income", "age", "credit_amount", "guarantee_value",
               "guarantee_credit_ratio", "liquidity_score", "income_per_age", "weighted_guarantee"],
  "coef": [0.85, 0.10, -1.20, 0.45, 0.95, 0.40, 0.30, 0.55], "intercept": 0.25})";

json form() {
  return {{"monthly_income", 8000.0}, {"age", 35}, {"credit_amount", 50000.0},
          {"guarantee_value", 80000.0}, {"guarantee_liquidity", "media"}};
}

} // namespace

TEST(RequestIoTest, FormPayloadIsExpanded) {
  const ApplicationInput in = applicationFromJson(form());
  EXPECT_EQ(in.size(), 8u);
  EXPECT_DOUBLE_EQ(in.at("liquidity_score"), 2.0);
}

TEST(RequestIoTest, FormMissingFieldsAreListed) {
  json j = form();
  j.erase("credit_amount");
  j.erase("age");
  try {
    applicationFromJson(j);
    FAIL() << "expected MissingFeatureError";
  } catch (const MissingFeatureError& e) {
    EXPECT_EQ(e.missing(), (std::vector<std::string>{"age", "credit_amount"}));
  }
}

TEST(RequestIoTest, FlatPayloadIsTakenAsIs) {
  const ApplicationInput in = applicationFromJson(json{{"income", 5000}, {"age", 35}});
  EXPECT_EQ(in.size(), 2u);
  EXPECT_DOUBLE_EQ(in.at("income"), 5000.0);
}

TEST(RequestIoTest, NonNumericFieldsAreRejected) {
  EXPECT_THROW(applicationFromJson(json{{"income", "lots"}}), InvalidValueError);
  json j = form();
  j["age"] = "thirty";
  EXPECT_THROW(applicationFromJson(j), InvalidValueError);
  j = form();
  j["guarantee_liquidity"] = "frozen";
  EXPECT_THROW(applicationFromJson(j), InvalidValueError);
  EXPECT_THROW(applicationFromJson(json::array()), InvalidValueError);
}

TEST(RequestIoTest, FormScoresAndRecordsHistory) {
  CreditEngine engine(loadModel(kFormModel), loadSchema(kFormSchema));
  const DecisionReport r = engine.evaluate(applicationFromJson(form()));

  const auto row = historyRowFor(r, "2025-03-01 10:00:00");
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->liquidity, "medium");
  EXPECT_DOUBLE_EQ(row->credit_amount, 50000.0);
  EXPECT_EQ(row->approved, r.prediction().label == Decision::Approved);
}

TEST(RequestIoTest, UnderageApplicantIsInvalid) {
  CreditEngine engine(loadModel(kFormModel), loadSchema(kFormSchema));
  json j = form();
  j["age"] = 16;
  EXPECT_THROW(engine.evaluate(applicationFromJson(j)), InvalidValueError);
}
