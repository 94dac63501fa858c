#pragma once
#include <string>
#include <vector>

#include "nllscan/scan/ScanSet.hh"

namespace nllscan {

/// Holds a merged scan table: one column per POI plus dnll2 (or delta_nll).
class ScanTable {
public:
  ScanTable() = default;

  /// Load a CSV whose first non-comment row names the columns; comments (#)
  /// are ignored, fields are separated by commas or whitespace. Empty or
  /// "nan" fields mark failed fits.
  /// Returns true on success.
  bool LoadCSV(const std::string& path);

  const std::vector<std::string>& columns() const noexcept { return names_; }
  std::size_t rows() const noexcept { return values_.empty() ? 0 : values_.front().size(); }

  bool HasColumn(const std::string& name) const;
  /// Throws std::out_of_range for unknown names.
  const std::vector<double>& Column(const std::string& name) const;

  /// dnll2 column, or 2 * delta_nll when only that is present.
  std::vector<double> Dnll2() const;

  ScanSet1D MakeScanSet1D(const std::string& poi) const;
  ScanSet2D MakeScanSet2D(const std::string& poi1, const std::string& poi2) const;

private:
  std::vector<std::string>         names_;
  std::vector<std::vector<double>> values_;
};

} // namespace nllscan
