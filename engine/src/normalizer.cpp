#include "normalizer.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

namespace credit {

double scaleValue(const FeatureSpec& spec, double raw) {
    if (spec.scale == 0.0) return 0.0;
    return (raw - spec.center) / spec.scale;
}

NormalizedVector normalize(const ApplicationInput& input, const FeatureSchema& schema) {
    // --- 1) every schema feature must be present ---
    std::vector<std::string> missing;
    for (const auto& f : schema.features) {
        if (!input.has(f.name)) missing.push_back(f.name);
    }
    if (!missing.empty()) throw MissingFeatureError(std::move(missing));

    // --- 2) validate and scale in schema order ---
    NormalizedVector out;
    out.reserve(schema.size());
    for (const auto& f : schema.features) {
        const double raw = input.at(f.name);
        if (!std::isfinite(raw)) {
            throw InvalidValueError("Feature '" + f.name + "' is not a finite number");
        }
        if ((f.lower && raw < *f.lower) || (f.upper && raw > *f.upper)) {
            std::ostringstream ss;
            ss << "Feature '" << f.name << "' value " << raw << " outside [";
            if (f.lower) ss << *f.lower; else ss << "-inf";
            ss << ", ";
            if (f.upper) ss << *f.upper; else ss << "inf";
            ss << "]";
            throw InvalidValueError(ss.str());
        }
        const double scaled = scaleValue(f, raw);
        if (!std::isfinite(scaled)) {
            throw InvalidValueError("Feature '" + f.name + "' overflows when scaled");
        }
        out.push_back(scaled);
    }
    return out;
}

NormalizedVector baselineVector(const FeatureSchema& schema) {
    NormalizedVector out;
    out.reserve(schema.size());
    for (const auto& f : schema.features) out.push_back(scaleValue(f, f.baseline));
    return out;
}

} // namespace credit
