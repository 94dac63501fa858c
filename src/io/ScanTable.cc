#include "nllscan/io/ScanTable.hh"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace nllscan {

namespace {
inline bool is_comment_or_empty(const std::string& s) {
  for (char c : s) { if (c == '#') return true; if (!std::isspace(static_cast<unsigned char>(c))) return false; }
  return true;
}

inline void trim(std::string& s) {
  size_t i = 0; while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  size_t j = s.size(); while (j > i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
  s = s.substr(i, j - i);
}

std::vector<std::string> split_fields(const std::string& line) {
  std::vector<std::string> out;
  if (line.find(',') != std::string::npos) {
    std::stringstream ss(line);
    std::string tok;
    while (std::getline(ss, tok, ',')) { trim(tok); out.push_back(tok); }
    // getline drops a trailing empty field ("2.0,")
    std::string tail = line; trim(tail);
    if (!tail.empty() && tail.back() == ',') out.emplace_back();
  } else {
    std::stringstream ss(line);
    std::string tok;
    while (ss >> tok) out.push_back(tok);
  }
  return out;
}

inline bool parse_value(const std::string& tok, double& v) {
  if (tok.empty()) { v = std::numeric_limits<double>::quiet_NaN(); return true; }
  try {
    size_t pos = 0;
    v = std::stod(tok, &pos);
    return pos == tok.size();
  } catch (const std::exception&) {
    return false;
  }
}
} // namespace

bool ScanTable::LoadCSV(const std::string& path) {
  names_.clear(); values_.clear();

  std::ifstream in(path);
  if (!in) return false;

  std::string line;
  bool saw_header = false;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (line.empty() || is_comment_or_empty(line)) continue;
    const auto fields = split_fields(line);
    if (!saw_header) {
      saw_header = true;
      names_ = fields;
      values_.assign(names_.size(), {});
      continue;
    }

    std::vector<double> row(fields.size());
    bool ok = fields.size() == names_.size();
    for (size_t i = 0; ok && i < fields.size(); ++i) ok = parse_value(fields[i], row[i]);
    if (!ok) {
      std::cerr << "[io] WARNING: skipping malformed line " << lineno << " of " << path << "\n";
      continue;
    }
    for (size_t i = 0; i < row.size(); ++i) values_[i].push_back(row[i]);
  }
  return saw_header && rows() > 0;
}

bool ScanTable::HasColumn(const std::string& name) const {
  return std::find(names_.begin(), names_.end(), name) != names_.end();
}

const std::vector<double>& ScanTable::Column(const std::string& name) const {
  const auto it = std::find(names_.begin(), names_.end(), name);
  if (it == names_.end())
    throw std::out_of_range("ScanTable: no column '" + name + "'");
  return values_[static_cast<size_t>(std::distance(names_.begin(), it))];
}

std::vector<double> ScanTable::Dnll2() const {
  if (HasColumn("dnll2")) return Column("dnll2");
  if (HasColumn("delta_nll")) {
    std::vector<double> out = Column("delta_nll");
    for (double& v : out) v *= 2.0;
    return out;
  }
  throw std::runtime_error("ScanTable: neither 'dnll2' nor 'delta_nll' column present");
}

ScanSet1D ScanTable::MakeScanSet1D(const std::string& poi) const {
  return ScanSet1D(Column(poi), Dnll2());
}

ScanSet2D ScanTable::MakeScanSet2D(const std::string& poi1, const std::string& poi2) const {
  return ScanSet2D(Column(poi1), Column(poi2), Dnll2());
}

} // namespace nllscan
