#pragma once
#include "application.hpp"
#include "feature_schema.hpp"

namespace credit {

// Applies the fitted scaler to one application. Output follows schema order.
// Throws MissingFeatureError / InvalidValueError; never defaults a value.
NormalizedVector normalize(const ApplicationInput& input, const FeatureSchema& schema);

// Scaled value of a single raw input. Zero-variance columns map to 0.
double scaleValue(const FeatureSpec& spec, double raw);

// The schema baseline (training mean by default) in normalized space.
NormalizedVector baselineVector(const FeatureSchema& schema);

} // namespace credit
