#include "nllscan/io/ConfigManager.hh"
#include "nllscan/io/ScanTable.hh"
#include "nllscan/scan/ScanEvaluator.hh"

#include <array>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace nllscan;

// helper: print one bound, or "n/a" when the level is not reached
static std::string bound_str(const std::optional<double>& v) {
  if (!v) return "n/a";
  std::ostringstream ss;
  ss << std::setprecision(6) << *v;
  return ss.str();
}

static void PrintAxis(const std::string& name, const AxisResult& r) {
  std::cout << "  " << name << " = " << FormatAxisResult(r, 4) << "\n"
            << "    -2sigma: " << bound_str(r.minus2)
            << "  -1sigma: " << bound_str(r.minus1)
            << "  +1sigma: " << bound_str(r.plus1)
            << "  +2sigma: " << bound_str(r.plus2) << "\n";
}

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: nllscan_evaluate <config.json>\n";
    return 1;
  }

  try {
    ConfigManager cfg(argv[1]);
    cfg.parse();

    const auto& scan_cfg = cfg.scan();

    ScanTable table;
    if (!table.LoadCSV(scan_cfg.input))
      throw std::runtime_error("Cannot read scan table: " + scan_cfg.input);

    std::cout << "[nllscan] Run: " << cfg.run().label << "\n"
              << "  Input: " << scan_cfg.input << " (" << table.rows() << " points)\n";

    ScanEvaluator evaluator(cfg.statistics());

    if (scan_cfg.pois.size() == 1) {
      const auto scan = table.MakeScanSet1D(scan_cfg.pois[0]);
      const auto eval = evaluator.Evaluate(scan, scan_cfg.poi_mins[0]);

      std::cout << "\n[result]\n";
      PrintAxis(scan_cfg.pois[0], eval.result.poi);
    } else {
      const auto scan = table.MakeScanSet2D(scan_cfg.pois[0], scan_cfg.pois[1]);

      std::optional<std::array<double, 2>> mins;
      if (scan_cfg.poi_mins[0] && scan_cfg.poi_mins[1])
        mins = std::array<double, 2>{*scan_cfg.poi_mins[0], *scan_cfg.poi_mins[1]};
      const auto eval = evaluator.Evaluate(scan, mins);

      std::cout << "\n[result]\n";
      PrintAxis(scan_cfg.pois[0], eval.result.poi1);
      PrintAxis(scan_cfg.pois[1], eval.result.poi2);
      if (const auto n = eval.grid.CountUndefined(); n > 0)
        std::cout << "  (" << n << " grid cells remain undefined)\n";
    }
    return 0;
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 2;
  }
}
