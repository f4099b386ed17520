#pragma once
#include "feature_schema.hpp"
#include "model.hpp"
#include <string>

namespace credit {

// Artifact deserialization. Both artifacts are JSON exports of the fitted
// scaler and classifier; any defect raises ArtifactLoadError.
ModelArtifact loadModel(const std::string& bytes);
FeatureSchema loadSchema(const std::string& bytes);

ModelArtifact loadModelFile(const std::string& path);
FeatureSchema loadSchemaFile(const std::string& path);

// Rejects a schema/model pair whose feature order differs.
void checkArtifactPair(const ModelArtifact& model, const FeatureSchema& schema);

} // namespace credit
