#include "model_loader.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace credit {

static std::string readFile(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw ArtifactLoadError("Could not open artifact file: " + path);
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static json parseArtifact(const std::string& bytes, const char* what) {
    try {
        json j = json::parse(bytes);
        if (!j.is_object()) throw ArtifactLoadError(std::string(what) + " artifact is not a JSON object");
        return j;
    } catch (const json::exception& e) {
        throw ArtifactLoadError(std::string("Malformed ") + what + " artifact: " + e.what());
    }
}

static void requireFinite(double v, const std::string& field) {
    if (!std::isfinite(v)) throw ArtifactLoadError("Non-finite value in '" + field + "'");
}

static LinearTerms parseLinear(const json& j, std::size_t n_features) {
    LinearTerms t;
    t.coef      = j.at("coef").get<std::vector<double>>();
    t.intercept = j.value("intercept", 0.0);
    if (t.coef.size() != n_features) {
        throw ArtifactLoadError("Model dimension mismatch in JSON: " + std::to_string(n_features) +
                                " features but " + std::to_string(t.coef.size()) + " coefficients");
    }
    for (double c : t.coef) requireFinite(c, "coef");
    requireFinite(t.intercept, "intercept");
    return t;
}

static TreeNode parseNode(const json& jn) {
    TreeNode nd;
    nd.left  = jn.value("left", -1);
    nd.right = jn.value("right", -1);
    if (nd.leaf()) {
        auto v = jn.at("value").get<std::vector<double>>();
        if (v.size() != 2) throw ArtifactLoadError("Leaf value must hold [denied, approved] weights");
        const double z = v[0] + v[1];
        if (!(z > 0.0) || v[0] < 0.0 || v[1] < 0.0) throw ArtifactLoadError("Leaf value has no positive weight");
        nd.p_approved = v[1] / z;
        return nd;
    }
    nd.feature   = jn.at("feature").get<int>();
    nd.threshold = jn.at("threshold").get<double>();
    return nd;
}

// topology (feature range, child order) is checked by the ForestModel constructor
static std::vector<DecisionTree> parseForest(const json& j) {
    std::vector<DecisionTree> trees;
    const auto& jt = j.at("trees");
    if (!jt.is_array()) throw ArtifactLoadError("Forest 'trees' must be an array");
    trees.reserve(jt.size());
    for (const auto& tree : jt) {
        const auto& jn = tree.at("nodes");
        if (!jn.is_array()) throw ArtifactLoadError("Forest tree 'nodes' must be an array");
        DecisionTree t;
        t.nodes.reserve(jn.size());
        for (const auto& node : jn) t.nodes.push_back(parseNode(node));
        trees.push_back(std::move(t));
    }
    return trees;
}

ModelArtifact loadModel(const std::string& bytes) {
    json j = parseArtifact(bytes, "model");

    ModelArtifact m;
    try {
        m.features  = j.at("features").get<std::vector<std::string>>();
        m.threshold = j.value("decision_threshold", 0.5);
        m.version   = j.value("version", std::string("unversioned"));
        const std::string family = j.value("family", std::string("logistic"));

        if (m.features.empty()) throw ArtifactLoadError("Model declares no features");
        if (!(m.threshold >= 0.0 && m.threshold <= 1.0)) {
            throw ArtifactLoadError("decision_threshold must lie in [0, 1]");
        }

        if (family == "logistic") {
            m.model = std::make_shared<LogisticModel>(parseLinear(j, m.features.size()));
        } else if (family == "random_forest") {
            auto forest = std::make_shared<ForestModel>(m.features.size(), parseForest(j));
            Log::write(LogLevel::Debug, "Forest '%s' holds %zu trees", m.version.c_str(), forest->treeCount());
            m.model = std::move(forest);
        } else {
            throw ArtifactLoadError("Unknown model family '" + family + "'");
        }
    } catch (const json::exception& e) {
        throw ArtifactLoadError(std::string("Malformed model artifact: ") + e.what());
    }

    Log::write(LogLevel::Debug, "Parsed %s model '%s' with %zu features",
               m.model->family(), m.version.c_str(), m.features.size());
    return m;
}

static Scaling parseScaling(const std::string& s) {
    if (s == "standard") return Scaling::Standard;
    if (s == "minmax") return Scaling::MinMax;
    throw ArtifactLoadError("Unknown scaling '" + s + "'");
}

static FeatureSpec parseFeature(const json& jf, Scaling default_scaling) {
    FeatureSpec f;
    f.name = jf.at("name").get<std::string>();
    if (f.name.empty()) throw ArtifactLoadError("Feature with empty name");
    f.scaling = jf.contains("scaling") ? parseScaling(jf.at("scaling").get<std::string>()) : default_scaling;

    if (f.scaling == Scaling::Standard) {
        f.center = jf.at("mean").get<double>();
        f.scale  = jf.at("scale").get<double>();
        f.baseline = jf.value("baseline", f.center);
    } else {
        const double lo = jf.at("min").get<double>();
        const double hi = jf.at("max").get<double>();
        if (hi < lo) throw ArtifactLoadError("Feature '" + f.name + "' has max < min");
        f.center = lo;
        f.scale  = hi - lo;
        f.baseline = jf.value("baseline", jf.value("mean", lo + 0.5 * f.scale));
    }
    requireFinite(f.center, f.name);
    requireFinite(f.scale, f.name);
    requireFinite(f.baseline, f.name);
    if (f.scale < 0.0) throw ArtifactLoadError("Feature '" + f.name + "' has negative scale");

    if (jf.contains("lower")) f.lower = jf.at("lower").get<double>();
    if (jf.contains("upper")) f.upper = jf.at("upper").get<double>();
    if (f.lower && f.upper && *f.upper < *f.lower) {
        throw ArtifactLoadError("Feature '" + f.name + "' has upper bound below lower bound");
    }
    return f;
}

FeatureSchema loadSchema(const std::string& bytes) {
    json j = parseArtifact(bytes, "schema");

    FeatureSchema s;
    try {
        s.version = j.value("version", std::string("unversioned"));
        const Scaling def = parseScaling(j.value("scaling", std::string("standard")));
        const auto& jf = j.at("features");
        if (!jf.is_array() || jf.empty()) throw ArtifactLoadError("Schema declares no features");

        for (const auto& f : jf) {
            FeatureSpec spec = parseFeature(f, def);
            if (s.indexOf(spec.name) >= 0) {
                throw ArtifactLoadError("Duplicate feature '" + spec.name + "' in schema");
            }
            s.features.push_back(std::move(spec));
        }
    } catch (const json::exception& e) {
        throw ArtifactLoadError(std::string("Malformed schema artifact: ") + e.what());
    }
    return s;
}

ModelArtifact loadModelFile(const std::string& path) {
    ModelArtifact m = loadModel(readFile(path));
    Log::write(LogLevel::Info, "Loaded %s model from '%s' with %zu features, threshold=%.2f",
               m.model->family(), path.c_str(), m.features.size(), m.threshold);
    return m;
}

FeatureSchema loadSchemaFile(const std::string& path) {
    FeatureSchema s = loadSchema(readFile(path));
    Log::write(LogLevel::Info, "Loaded feature schema '%s' from '%s' (%zu features)",
               s.version.c_str(), path.c_str(), s.size());
    return s;
}

void checkArtifactPair(const ModelArtifact& model, const FeatureSchema& schema) {
    if (!model.model) throw ArtifactLoadError("No model loaded");
    if (model.features.size() != schema.size()) {
        throw ArtifactLoadError("Schema has " + std::to_string(schema.size()) +
                                " features but model was trained on " +
                                std::to_string(model.features.size()));
    }
    const auto names = schema.names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (model.features[i] != names[i]) {
            throw ArtifactLoadError("Feature order mismatch at position " + std::to_string(i) +
                                    ": schema '" + names[i] + "' vs model '" +
                                    model.features[i] + "'");
        }
    }
    if (model.model->featureCount() != schema.size()) {
        throw ArtifactLoadError("Model parameters do not match schema width");
    }
}

} // namespace credit
