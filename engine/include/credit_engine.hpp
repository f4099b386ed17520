#pragma once
#include "application.hpp"
#include "engine_config.hpp"
#include "feature_schema.hpp"
#include "model.hpp"
#include "report.hpp"
#include <memory>
#include <mutex>

namespace credit {

// One validated model/schema pair. evaluate() is const and touches no shared
// mutable state, so a single engine serves any number of threads.
class CreditEngine {
public:
    // Throws ArtifactLoadError if the pair does not match.
    CreditEngine(ModelArtifact model, FeatureSchema schema, EngineConfig cfg = {});

    DecisionReport evaluate(const ApplicationInput& input) const;

    const FeatureSchema& schema() const { return schema_; }
    const ModelArtifact& model() const { return model_; }
    const EngineConfig& config() const { return cfg_; }
    double threshold() const { return threshold_; }

private:
    ModelArtifact model_;
    FeatureSchema schema_;
    EngineConfig cfg_;
    double threshold_;
};

// Holds the engine currently accepting requests. A reload builds a complete
// engine first and then swaps it in; readers keep whichever engine they took.
class EngineSlot {
public:
    void install(std::shared_ptr<const CreditEngine> engine);
    // Throws ArtifactLoadError while nothing is installed.
    std::shared_ptr<const CreditEngine> current() const;
    bool ready() const;

private:
    mutable std::mutex m_;
    std::shared_ptr<const CreditEngine> engine_;
};

} // namespace credit
