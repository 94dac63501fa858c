#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "nllscan/stats/StatisticsConfig.hh"

namespace nllscan {

struct RunHeader {
  std::string label;
  int         verbosity = 1;
};

struct ScanJSON {
  std::string                         input;     // CSV scan table
  std::vector<std::string>            pois;      // 1 or 2 names
  std::vector<std::optional<double>>  poi_mins;  // externally known best fit, per poi
};

class ConfigManager {
public:
  explicit ConfigManager(std::string path);
  void parse();
  /// Same as parse() on an in-memory document.
  void parse(const nlohmann::json& j);

  const RunHeader&               run()        const noexcept { return run_; }
  const ScanJSON&                scan()       const noexcept { return scan_; }
  const stats::StatisticsConfig& statistics() const noexcept { return stats_; }

private:
  std::string             path_;
  RunHeader               run_;
  ScanJSON                scan_;
  stats::StatisticsConfig stats_;

  void parse_run_(const nlohmann::json& j);
  void parse_scan_(const nlohmann::json& j);
  void parse_minimizer_(const nlohmann::json& j);
  void parse_grid_(const nlohmann::json& j);
  void parse_chi2_levels_(const nlohmann::json& j);
};

} // namespace nllscan
