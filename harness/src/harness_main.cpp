#include "log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

using json = nlohmann::json;

// Fitted statistics of the demo scaler: name, mean, scale, lower, upper.
struct DemoColumn {
  const char* name;
  double mean, scale, lower, upper;
};

static const DemoColumn kColumns[] = {
  {"monthly_income",          8200.0,  5100.0,  500.0, 100000.0},
  {"age",                       41.0,    12.5,   18.0,     90.0},
  {"credit_amount",          92000.0, 81000.0, 1000.0, 500000.0},
  {"guarantee_value",       140000.0,120000.0, 1000.0,1000000.0},
  {"guarantee_credit_ratio",     1.9,     1.4,    0.0,    1000.0},
  {"liquidity_score",            2.0,     0.8,    1.0,      3.0},
  {"income_per_age",           205.0,   140.0,    0.0,   10000.0},
  {"weighted_guarantee",         3.9,     3.1,    0.0,    3000.0},
};

static const double kCoef[] = {0.85, 0.10, -1.20, 0.45, 0.95, 0.40, 0.30, 0.55};

static bool writeJson(const std::string& path, const json& j) {
  std::ofstream f(path, std::ios::trunc);
  if (!f.is_open()) {
    Log::write(LogLevel::Error, "Failed to open %s for writing", path.c_str());
    return false;
  }
  f << j.dump(2) << '\n';
  Log::write(LogLevel::Info, "Wrote %s", path.c_str());
  return true;
}

static json featureNames() {
  json names = json::array();
  for (const auto& c : kColumns) names.push_back(c.name);
  return names;
}

static json demoSchema() {
  json features = json::array();
  for (const auto& c : kColumns) {
    features.push_back({{"name", c.name}, {"mean", c.mean}, {"scale", c.scale},
                        {"lower", c.lower}, {"upper", c.upper}});
  }
  return {{"version", "demo-1"}, {"scaling", "standard"}, {"features", features}};
}

static json demoLogistic() {
  return {{"family", "logistic"}, {"version", "demo-1"}, {"features", featureNames()},
          {"coef", std::vector<double>(std::begin(kCoef), std::end(kCoef))},
          {"intercept", 0.25}, {"decision_threshold", 0.5}};
}

// Depth-2 trees split on a random feature; leaves lean towards the sign of
// the linear demo model so both artifacts broadly agree.
static json demoForest(std::mt19937& rng) {
  const int n_features = static_cast<int>(std::size(kColumns));
  std::uniform_int_distribution<int> pick(0, n_features - 1);
  std::normal_distribution<double> split(0.0, 0.8);
  std::uniform_int_distribution<int> weight(5, 40);

  auto leaf = [&](bool favourable) {
    const int a = weight(rng), b = weight(rng);
    const int approved = favourable ? std::max(a, b) : std::min(a, b);
    const int denied   = favourable ? std::min(a, b) : std::max(a, b);
    return json{{"value", {denied, approved}}};
  };

  json trees = json::array();
  for (int t = 0; t < 25; ++t) {
    const int f0 = pick(rng), f1 = pick(rng), f2 = pick(rng);
    const bool up0 = kCoef[f0] > 0.0, up1 = kCoef[f1] > 0.0, up2 = kCoef[f2] > 0.0;
    json nodes = json::array();
    nodes.push_back({{"feature", f0}, {"threshold", split(rng)}, {"left", 1}, {"right", 4}});
    nodes.push_back({{"feature", f1}, {"threshold", split(rng)}, {"left", 2}, {"right", 3}});
    nodes.push_back(leaf(!up0 && !up1));
    nodes.push_back(leaf(!up0 && up1));
    nodes.push_back({{"feature", f2}, {"threshold", split(rng)}, {"left", 5}, {"right", 6}});
    nodes.push_back(leaf(up0 && !up2));
    nodes.push_back(leaf(up0 && up2));
    trees.push_back({{"nodes", nodes}});
  }
  return {{"family", "random_forest"}, {"version", "demo-forest-1"}, {"features", featureNames()},
          {"decision_threshold", 0.5}, {"trees", trees}};
}

int main() {
  Log::init();
  Log::write(LogLevel::Info, "Demo artifact export starting");

  std::error_code ec;
  std::filesystem::create_directories("models", ec);
  std::filesystem::create_directories("data", ec);
  if (ec) {
    Log::write(LogLevel::Error, "Could not create output directories: %s", ec.message().c_str());
    return 1;
  }

  std::mt19937 rng{42};
  const json application = {
    {"monthly_income", 8000.0}, {"age", 35}, {"credit_amount", 50000.0},
    {"guarantee_value", 80000.0}, {"guarantee_liquidity", "medium"}
  };

  const bool ok = writeJson("models/credit_schema.json", demoSchema()) &&
                  writeJson("models/credit_model.json", demoLogistic()) &&
                  writeJson("models/credit_forest.json", demoForest(rng)) &&
                  writeJson("data/application.json", application);
  if (!ok) return 1;

  Log::write(LogLevel::Info, "Demo artifacts complete -> models/, data/application.json");
  return 0;
}
