#include "credit_engine.hpp"
#include "errors.hpp"
#include "explainer.hpp"
#include "log.hpp"
#include "model_loader.hpp"
#include "normalizer.hpp"

namespace credit {

CreditEngine::CreditEngine(ModelArtifact model, FeatureSchema schema, EngineConfig cfg)
    : model_(std::move(model)), schema_(std::move(schema)), cfg_(cfg),
      threshold_(cfg.threshold ? *cfg.threshold : model_.threshold) {
    checkArtifactPair(model_, schema_);
    if (!(threshold_ >= 0.0 && threshold_ <= 1.0)) {
        throw InvalidValueError("Decision threshold must lie in [0, 1]");
    }
    for (std::size_t i = 0; i < schema_.size(); ++i) {
        if (schema_.zeroVariance(i)) {
            Log::write(LogLevel::Warn, "Feature '%s' has zero variance; its contribution is always 0",
                       schema_.features[i].name.c_str());
        }
    }
    Log::write(LogLevel::Info, "Engine ready | model=%s (%s) schema=%s | threshold=%.2f explanation=%s",
               model_.version.c_str(), model_.model->family(), schema_.version.c_str(),
               threshold_, methodName(cfg_.method));
}

DecisionReport CreditEngine::evaluate(const ApplicationInput& input) const {
    const NormalizedVector x = normalize(input, schema_);
    const Prediction p = predict(x, *model_.model, threshold_);
    Explanation ex = explain(*model_.model, x, schema_, cfg_);
    return assemble(input, p, std::move(ex));
}

void EngineSlot::install(std::shared_ptr<const CreditEngine> engine) {
    if (!engine) throw ArtifactLoadError("Refusing to install an empty engine");
    std::scoped_lock lk(m_);
    engine_ = std::move(engine);
}

std::shared_ptr<const CreditEngine> EngineSlot::current() const {
    std::scoped_lock lk(m_);
    if (!engine_) throw ArtifactLoadError("No model/schema pair has been loaded");
    return engine_;
}

bool EngineSlot::ready() const {
    std::scoped_lock lk(m_);
    return engine_ != nullptr;
}

} // namespace credit
