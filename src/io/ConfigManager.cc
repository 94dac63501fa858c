#include "nllscan/io/ConfigManager.hh"
#include <array>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace nllscan {

ConfigManager::ConfigManager(std::string path) : path_(std::move(path)) {}

void ConfigManager::parse() {
  std::ifstream in(path_);
  if (!in) throw std::runtime_error("Cannot open config: " + path_);
  nlohmann::json j;
  in >> j;
  parse(j);
}

void ConfigManager::parse(const nlohmann::json& j) {
  parse_run_(j.at("run"));
  parse_scan_(j.at("scan"));
  if (j.contains("minimizer"))   parse_minimizer_(j.at("minimizer"));
  if (j.contains("grid"))        parse_grid_(j.at("grid"));
  if (j.contains("chi2_levels")) parse_chi2_levels_(j.at("chi2_levels"));
  stats_.verbosity = run_.verbosity;
}

void ConfigManager::parse_run_(const nlohmann::json& j) {
  run_.label     = j.value("label", std::string{});
  run_.verbosity = j.value("verbosity", 1);
}

void ConfigManager::parse_scan_(const nlohmann::json& j) {
  scan_.input = j.at("input").get<std::string>();
  scan_.pois  = j.at("pois").get<std::vector<std::string>>();
  if (scan_.pois.empty() || scan_.pois.size() > 2)
    throw std::invalid_argument("scan.pois must name 1 or 2 parameters");

  scan_.poi_mins.assign(scan_.pois.size(), std::nullopt);
  if (j.contains("poi_mins")) {
    const auto& jm = j.at("poi_mins");
    if (!jm.is_array() || jm.size() != scan_.pois.size())
      throw std::invalid_argument("scan.poi_mins must have one entry per poi");
    for (std::size_t i = 0; i < jm.size(); ++i) {
      if (!jm[i].is_null()) scan_.poi_mins[i] = jm[i].get<double>();
    }
  }
}

void ConfigManager::parse_minimizer_(const nlohmann::json& j) {
  auto& m = stats_.minimizer;
  m.edge_epsilon       = j.value("edge_epsilon", m.edge_epsilon);
  m.max_iterations     = j.value("max_iterations", m.max_iterations);
  m.abs_tolerance      = j.value("abs_tolerance", m.abs_tolerance);
  m.rel_tolerance      = j.value("rel_tolerance", m.rel_tolerance);
  m.scan_points        = j.value("scan_points", m.scan_points);
  m.tolerance          = j.value("tolerance", m.tolerance);
  // read signed so that negative values are rejected instead of wrapping
  const long long calls    = j.value("max_function_calls", static_cast<long long>(m.max_function_calls));
  const int       strategy = j.value("strategy", static_cast<int>(m.strategy));
  if (j.contains("start"))
    m.start = j.at("start").get<std::array<double, 2>>();

  if (m.edge_epsilon < 0.0)    throw std::invalid_argument("minimizer.edge_epsilon must be >= 0");
  if (m.max_iterations <= 0)   throw std::invalid_argument("minimizer.max_iterations must be > 0");
  if (calls <= 0 || calls > static_cast<long long>(std::numeric_limits<unsigned int>::max()))
    throw std::invalid_argument("minimizer.max_function_calls must be > 0");
  if (strategy < 0)
    throw std::invalid_argument("minimizer.strategy must be >= 0");
  m.max_function_calls = static_cast<unsigned int>(calls);
  m.strategy           = static_cast<unsigned int>(strategy);
}

void ConfigManager::parse_grid_(const nlohmann::json& j) {
  auto& g = stats_.grid;
  g.fill_nans = j.value("fill_nans", g.fill_nans);
  g.z_log     = j.value("z_log", g.z_log);
  if (j.contains("z_min") && !j.at("z_min").is_null())
    g.z_min = j.at("z_min").get<double>();
}

void ConfigManager::parse_chi2_levels_(const nlohmann::json& j) {
  const auto row1 = j.at("1").get<std::array<double, 2>>();
  const auto row2 = j.at("2").get<std::array<double, 2>>();
  stats_.chi2_levels = stats::ChiSquareLevels(row1, row2);
}

} // namespace nllscan
