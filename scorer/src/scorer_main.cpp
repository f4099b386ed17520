#include "log.hpp"
#include "credit_engine.hpp"
#include "errors.hpp"
#include "history_io.hpp"
#include "model_loader.hpp"
#include "request_io.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

// Platform banner
#if defined(_WIN32)
  #define CD_PLATFORM "windows"
#elif defined(__APPLE__)
  #define CD_PLATFORM "macos"
#elif defined(__linux__)
  #define CD_PLATFORM "linux"
#else
  #define CD_PLATFORM "unknown"
#endif

struct ScorerConfig {
  bool quiet = false;        // only warnings and errors
  bool json = false;         // machine-readable report on stdout
  bool summary = false;      // print history KPIs instead of scoring
  std::string model_path;    // empty: search the candidate locations
  std::string schema_path;
  std::string config_path = std::getenv("CD_CONFIG") ? std::getenv("CD_CONFIG") : "";
  std::string input_path = "data/application.json";
  std::string history_path = "data/history.csv";
};

// trivial flag parser: --quiet --json --summary --model=PATH --schema=PATH
// --config=PATH --input=PATH --history=PATH
static ScorerConfig parseArgs(int argc, char** argv) {
  ScorerConfig cfg;
  for (int i=1; i<argc; ++i) {
    std::string a = argv[i];
    if (a == "--quiet") cfg.quiet = true;
    else if (a == "--json") cfg.json = true;
    else if (a == "--summary") cfg.summary = true;
    else if (a.rfind("--model=",0)==0) cfg.model_path = a.substr(8);
    else if (a.rfind("--schema=",0)==0) cfg.schema_path = a.substr(9);
    else if (a.rfind("--config=",0)==0) cfg.config_path = a.substr(9);
    else if (a.rfind("--input=",0)==0) cfg.input_path = a.substr(8);
    else if (a.rfind("--history=",0)==0) cfg.history_path = a.substr(10);
    else Log::write(LogLevel::Warn, "Ignoring unknown argument '%s'", a.c_str());
  }
  return cfg;
}

static std::string resolveArtifactPath(const std::string& name) {
  const std::string candidates[] = {
    "models/" + name,          // run from repo root
    "../models/" + name,       // run from build/
    "../../models/" + name     // extra fallback
  };
  for (const auto& p : candidates) {
    if (std::filesystem::exists(p)) return p;
  }
  return "models/" + name; // default; the loader will throw if missing
}

static std::shared_ptr<const credit::CreditEngine> loadEngine(const ScorerConfig& CFG) {
  const std::string modelPath  = CFG.model_path.empty()  ? resolveArtifactPath("credit_model.json")  : CFG.model_path;
  const std::string schemaPath = CFG.schema_path.empty() ? resolveArtifactPath("credit_schema.json") : CFG.schema_path;

  credit::EngineConfig engineCfg;
  if (!CFG.config_path.empty()) {
    engineCfg = credit::loadConfigFile(CFG.config_path);
    Log::write(LogLevel::Info, "Loaded engine config from '%s'", CFG.config_path.c_str());
  }
  return std::make_shared<const credit::CreditEngine>(
      credit::loadModelFile(modelPath), credit::loadSchemaFile(schemaPath), engineCfg);
}

static int printSummary(const ScorerConfig& CFG) {
  const auto rows = credit::readHistory(CFG.history_path);
  if (rows.empty()) {
    Log::write(LogLevel::Warn, "No history in %s yet. Score an application first.", CFG.history_path.c_str());
    return 0;
  }
  std::cout << credit::formatSummary(credit::summarize(rows));
  return 0;
}

static int scoreApplication(const ScorerConfig& CFG, const credit::CreditEngine& engine) {
  // --- 1) Read the application ---
  const credit::ApplicationInput input = credit::readApplicationFile(CFG.input_path);
  Log::write(LogLevel::Info, "Read application with %zu fields from '%s' (schema '%s' expects %zu)",
             input.size(), CFG.input_path.c_str(), engine.schema().version.c_str(), engine.schema().size());

  // --- 2) Evaluate ---
  const credit::DecisionReport report = engine.evaluate(input);
  const auto& p = report.prediction();
  Log::write(p.label == credit::Decision::Approved ? LogLevel::Info : LogLevel::Warn,
             "Decision: %s prob=%.3f threshold=%.2f",
             credit::decisionName(p.label), p.probability, engine.threshold());

  // --- 3) Render ---
  if (CFG.json) std::cout << credit::reportToJson(report).dump(2) << "\n";
  else std::cout << credit::formatReport(report, engine.config().top_n);

  // --- 4) Record in the simulation history ---
  if (auto row = credit::historyRowFor(report, credit::nowTimestamp())) {
    try {
      credit::appendHistory(CFG.history_path, *row);
      Log::write(LogLevel::Info, "Appended run to %s", CFG.history_path.c_str());
    } catch (const std::exception& e) {
      Log::write(LogLevel::Warn, "History not written: %s", e.what());
    }
  }
  return 0;
}

int main(int argc, char** argv) {
  Log::init();
  ScorerConfig CFG = parseArgs(argc, argv);
  if (CFG.json) Log::setMinLevel(LogLevel::Error);
  else if (CFG.quiet) Log::setMinLevel(LogLevel::Warn);
  Log::write(LogLevel::Info, "Credit scorer starting | platform=%s | build=%s %s",
             CD_PLATFORM, __DATE__, __TIME__);

  if (CFG.summary) return printSummary(CFG);

  // Artifacts must load before any request is accepted.
  credit::EngineSlot slot;
  try {
    slot.install(loadEngine(CFG));
  } catch (const std::exception& e) {
    Log::write(LogLevel::Error, "Startup failed, no model available: %s", e.what());
    return 2;
  }

  try {
    return scoreApplication(CFG, *slot.current());
  } catch (const credit::MissingFeatureError& e) {
    Log::write(LogLevel::Error, "Incomplete application: %s", e.what());
  } catch (const credit::ExplanationTimeoutError& e) {
    Log::write(LogLevel::Error, "Explanation timed out: %s", e.what());
  } catch (const std::exception& e) {
    Log::write(LogLevel::Error, "Evaluation failed: %s", e.what());
  }
  return 1;
}
