#include "errors.hpp"
#include <utility>

namespace credit {

static std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += names[i];
    }
    return out;
}

MissingFeatureError::MissingFeatureError(std::vector<std::string> missing)
    : CreditError("Missing required feature(s): " + joinNames(missing)),
      missing_(std::move(missing)) {}

DimensionMismatchError::DimensionMismatchError(std::size_t expected, std::size_t actual)
    : CreditError("Feature vector size " + std::to_string(actual) +
                  " does not match model (expected " + std::to_string(expected) + ")"),
      expected_(expected), actual_(actual) {}

} // namespace credit
