#pragma once
#include "report.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace credit {

// One scorer run as kept in the simulation history CSV.
struct HistoryRow {
  std::string timestamp;      // "YYYY-MM-DD HH:MM:SS", local time
  double monthly_income{};
  double age{};
  double credit_amount{};
  double guarantee_value{};
  std::string liquidity;      // low / medium / high
  double probability{};       // rounded to 4 decimals when written
  bool approved{};
};

inline std::string historyHeader() {
  return "timestamp,monthly_income,age,credit_amount,guarantee_value,liquidity,probability,decision\n";
}

std::string historyToCsv(const HistoryRow& r);
HistoryRow historyFromCsv(const std::string& line);   // throws InvalidValueError

// Empty when the report was not made from the credit simulator fields.
std::optional<HistoryRow> historyRowFor(const DecisionReport& report, const std::string& timestamp);
std::string nowTimestamp();

// Appends, writing the header first when the file is new or empty.
void appendHistory(const std::string& path, const HistoryRow& row);
// Missing file reads as an empty history; malformed rows are skipped with a warning.
std::vector<HistoryRow> readHistory(const std::string& path);

struct RateBucket {
  std::size_t count{};
  std::size_t approved{};
  double probability_sum{};
  double approvalRate() const { return count ? static_cast<double>(approved) / count : 0.0; }
  double meanProbability() const { return count ? probability_sum / count : 0.0; }
};

struct HistorySummary {
  RateBucket overall;
  std::map<std::string, RateBucket> by_liquidity;
  std::vector<std::pair<std::string, RateBucket>> by_credit_band;   // fixed band order
};

const char* creditBand(double credit_amount);
HistorySummary summarize(const std::vector<HistoryRow>& rows);
std::string formatSummary(const HistorySummary& s);

} // namespace credit
