#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace credit {

enum class ExplanationMethod { Auto, Analytic, Perturbation };

const char* methodName(ExplanationMethod m);
ExplanationMethod parseMethod(const std::string& text);

struct EngineConfig {
    std::optional<double> threshold;          // overrides the artifact's threshold
    ExplanationMethod method = ExplanationMethod::Auto;
    std::chrono::milliseconds perturbation_timeout{250};   // 0 = unlimited
    std::size_t max_perturbation_calls = 512;              // 0 = unlimited
    std::size_t top_n = 8;                    // drivers shown in text reports
};

// {"threshold": 0.5, "explanation": "auto", "perturbation_timeout_ms": 250,
//  "max_perturbation_calls": 512, "top_n": 8}; every key is optional.
EngineConfig loadConfig(const std::string& bytes);
EngineConfig loadConfigFile(const std::string& path);

} // namespace credit
