#include "feature_schema.hpp"

namespace credit {

std::vector<std::string> FeatureSchema::names() const {
    std::vector<std::string> out;
    out.reserve(features.size());
    for (const auto& f : features) out.push_back(f.name);
    return out;
}

int FeatureSchema::indexOf(const std::string& name) const {
    for (std::size_t i = 0; i < features.size(); ++i) {
        if (features[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

} // namespace credit
