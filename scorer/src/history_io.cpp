#include "history_io.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <cmath>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace credit {

static const char* kBands[] = {"up to 50k", "50k-150k", "150k-300k", "300k-500k", "above 500k"};

std::string historyToCsv(const HistoryRow& r) {
  char prob[32];
  std::snprintf(prob, sizeof(prob), "%.4f", r.probability);
  return r.timestamp + "," +
         std::to_string(r.monthly_income) + "," +
         std::to_string(r.age) + "," +
         std::to_string(r.credit_amount) + "," +
         std::to_string(r.guarantee_value) + "," +
         r.liquidity + "," +
         prob + "," +
         (r.approved ? "approved" : "denied") + "\n";
}

HistoryRow historyFromCsv(const std::string& line) {
  std::string trimmed = line;
  while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) trimmed.pop_back();

  std::vector<std::string> tok;
  std::stringstream ss(trimmed);
  std::string cell;
  while (std::getline(ss, cell, ',')) tok.push_back(cell);
  if (tok.size() != 8) {
    throw InvalidValueError("History row has " + std::to_string(tok.size()) + " columns, expected 8");
  }
  HistoryRow r;
  try {
    r.timestamp       = tok[0];
    r.monthly_income  = std::stod(tok[1]);
    r.age             = std::stod(tok[2]);
    r.credit_amount   = std::stod(tok[3]);
    r.guarantee_value = std::stod(tok[4]);
    r.liquidity       = tok[5];
    r.probability     = std::stod(tok[6]);
  } catch (const std::logic_error& e) {
    throw InvalidValueError(std::string("History row has a non-numeric value: ") + e.what());
  }
  if (tok[7] == "approved") r.approved = true;
  else if (tok[7] == "denied") r.approved = false;
  else throw InvalidValueError("History row has unknown decision '" + tok[7] + "'");
  return r;
}

std::optional<HistoryRow> historyRowFor(const DecisionReport& report, const std::string& timestamp) {
  const auto& in = report.input();
  const char* required[] = {"monthly_income", "age", "credit_amount", "guarantee_value", "liquidity_score"};
  for (auto name : required) {
    if (!in.has(name)) return std::nullopt;
  }
  const double score = in.at("liquidity_score");
  if (score != 1.0 && score != 2.0 && score != 3.0) return std::nullopt;

  HistoryRow r;
  r.timestamp       = timestamp;
  r.monthly_income  = in.at("monthly_income");
  r.age             = in.at("age");
  r.credit_amount   = in.at("credit_amount");
  r.guarantee_value = in.at("guarantee_value");
  r.liquidity       = liquidityName(static_cast<Liquidity>(static_cast<int>(score)));
  r.probability     = std::round(report.prediction().probability * 10000.0) / 10000.0;
  r.approved        = report.prediction().label == Decision::Approved;
  return r;
}

std::string nowTimestamp() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

void appendHistory(const std::string& path, const HistoryRow& row) {
  std::error_code ec;
  const bool fresh = !std::filesystem::exists(path, ec) || std::filesystem::file_size(path, ec) == 0;
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);

  std::ofstream f(path, std::ios::app);
  if (!f.is_open()) {
    throw std::runtime_error("Could not open history file " + path + " for writing");
  }
  if (fresh) f << historyHeader();
  f << historyToCsv(row);
}

std::vector<HistoryRow> readHistory(const std::string& path) {
  std::vector<HistoryRow> rows;
  std::ifstream f(path);
  if (!f.is_open()) return rows;

  std::string line;
  std::size_t lineno = 0;
  while (std::getline(f, line)) {
    ++lineno;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    // files written by appendHistory start with the header; older exports may not
    if (lineno == 1 && line + "\n" == historyHeader()) continue;
    try {
      rows.push_back(historyFromCsv(line));
    } catch (const InvalidValueError& e) {
      Log::write(LogLevel::Warn, "Skipping history line %zu: %s", lineno, e.what());
    }
  }
  return rows;
}

const char* creditBand(double credit_amount) {
  if (credit_amount <= 50000.0)  return kBands[0];
  if (credit_amount <= 150000.0) return kBands[1];
  if (credit_amount <= 300000.0) return kBands[2];
  if (credit_amount <= 500000.0) return kBands[3];
  return kBands[4];
}

static void add(RateBucket& b, const HistoryRow& r) {
  ++b.count;
  if (r.approved) ++b.approved;
  b.probability_sum += r.probability;
}

HistorySummary summarize(const std::vector<HistoryRow>& rows) {
  HistorySummary s;
  for (auto band : kBands) s.by_credit_band.emplace_back(band, RateBucket{});
  for (const auto& r : rows) {
    add(s.overall, r);
    add(s.by_liquidity[r.liquidity], r);
    const std::string band = creditBand(r.credit_amount);
    for (auto& b : s.by_credit_band) {
      if (b.first == band) { add(b.second, r); break; }
    }
  }
  return s;
}

std::string formatSummary(const HistorySummary& s) {
  std::ostringstream out;
  char line[160];
  std::snprintf(line, sizeof(line), "Simulations: %zu | approval rate %.1f%% | mean probability %.1f%%\n",
                s.overall.count, s.overall.approvalRate() * 100.0, s.overall.meanProbability() * 100.0);
  out << line;
  out << "Approval by guarantee liquidity:\n";
  for (const auto& kv : s.by_liquidity) {
    std::snprintf(line, sizeof(line), "  %-8s %5zu runs  %5.1f%%\n",
                  kv.first.c_str(), kv.second.count, kv.second.approvalRate() * 100.0);
    out << line;
  }
  out << "Mean probability by requested credit:\n";
  for (const auto& b : s.by_credit_band) {
    if (b.second.count == 0) continue;
    std::snprintf(line, sizeof(line), "  %-10s %5zu runs  %.4f\n",
                  b.first.c_str(), b.second.count, b.second.meanProbability());
    out << line;
  }
  return out.str();
}

} // namespace credit
