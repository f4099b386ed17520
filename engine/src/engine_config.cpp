#include "engine_config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace credit {

const char* methodName(ExplanationMethod m) {
    switch (m) {
        case ExplanationMethod::Auto:         return "auto";
        case ExplanationMethod::Analytic:     return "analytic";
        case ExplanationMethod::Perturbation: return "perturbation";
    }
    return "unknown";
}

ExplanationMethod parseMethod(const std::string& text) {
    if (text == "auto") return ExplanationMethod::Auto;
    if (text == "analytic") return ExplanationMethod::Analytic;
    if (text == "perturbation") return ExplanationMethod::Perturbation;
    throw InvalidValueError("Unknown explanation method '" + text + "'");
}

EngineConfig loadConfig(const std::string& bytes) {
    EngineConfig cfg;
    try {
        json j = json::parse(bytes);
        if (j.contains("threshold")) {
            const double t = j.at("threshold").get<double>();
            if (!(t >= 0.0 && t <= 1.0)) throw InvalidValueError("threshold must lie in [0, 1]");
            cfg.threshold = t;
        }
        if (j.contains("explanation")) cfg.method = parseMethod(j.at("explanation").get<std::string>());
        const long long timeout = j.value("perturbation_timeout_ms", static_cast<long long>(cfg.perturbation_timeout.count()));
        if (timeout < 0) throw InvalidValueError("perturbation_timeout_ms must be >= 0");
        cfg.perturbation_timeout = std::chrono::milliseconds(timeout);
        const long long calls = j.value("max_perturbation_calls", static_cast<long long>(cfg.max_perturbation_calls));
        if (calls < 0) throw InvalidValueError("max_perturbation_calls must be >= 0");
        cfg.max_perturbation_calls = static_cast<std::size_t>(calls);
        const long long top_n = j.value("top_n", static_cast<long long>(cfg.top_n));
        if (top_n < 0) throw InvalidValueError("top_n must be >= 0");
        cfg.top_n = static_cast<std::size_t>(top_n);
    } catch (const json::exception& e) {
        throw InvalidValueError(std::string("Malformed engine config: ") + e.what());
    }
    return cfg;
}

EngineConfig loadConfigFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw std::runtime_error("Could not open config file: " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return loadConfig(ss.str());
}

} // namespace credit
