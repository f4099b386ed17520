#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace credit {

enum class Scaling { Standard, MinMax };

// One fitted column of the scaler export. For min-max columns `center` is the
// training minimum and `scale` the training range.
struct FeatureSpec {
    std::string name;
    Scaling scaling{Scaling::Standard};
    double center{};
    double scale{1.0};
    std::optional<double> lower;    // validation bounds on the raw value
    std::optional<double> upper;
    double baseline{};              // raw reference value for explanations
};

struct FeatureSchema {
    std::string version;
    std::vector<FeatureSpec> features;

    std::size_t size() const { return features.size(); }
    std::vector<std::string> names() const;
    // -1 when absent
    int indexOf(const std::string& name) const;
    bool zeroVariance(std::size_t i) const { return features.at(i).scale == 0.0; }
};

using NormalizedVector = std::vector<double>;

} // namespace credit
