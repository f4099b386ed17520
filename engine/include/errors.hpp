#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace credit {

// Base of every engine failure. All are request-scoped except
// ArtifactLoadError, which is fatal during startup.
class CreditError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MissingFeatureError : public CreditError {
public:
    explicit MissingFeatureError(std::vector<std::string> missing);
    const std::vector<std::string>& missing() const { return missing_; }
private:
    std::vector<std::string> missing_;
};

class InvalidValueError : public CreditError {
public:
    using CreditError::CreditError;
};

class DimensionMismatchError : public CreditError {
public:
    DimensionMismatchError(std::size_t expected, std::size_t actual);
    std::size_t expected() const { return expected_; }
    std::size_t actual() const { return actual_; }
private:
    std::size_t expected_;
    std::size_t actual_;
};

class ExplanationUnsupportedError : public CreditError {
public:
    using CreditError::CreditError;
};

class ExplanationTimeoutError : public CreditError {
public:
    using CreditError::CreditError;
};

class ArtifactLoadError : public CreditError {
public:
    using CreditError::CreditError;
};

} // namespace credit
