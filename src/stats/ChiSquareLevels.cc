#include "nllscan/stats/ChiSquareLevels.hh"

#include <cmath>
#include <stdexcept>
#include <string>

namespace nllscan::stats {

namespace {

constexpr std::array<double, 2> kNdof1 = {1.000, 4.000};
constexpr std::array<double, 2> kNdof2 = {2.296, 6.180};

} // namespace

ChiSquareLevels::ChiSquareLevels() : ChiSquareLevels(kNdof1, kNdof2) {}

ChiSquareLevels::ChiSquareLevels(std::array<double, 2> ndof1, std::array<double, 2> ndof2) {
  validate_row_(ndof1, 1);
  validate_row_(ndof2, 2);
  levels_ = {ndof1, ndof2};
}

double ChiSquareLevels::Level(int ndof, int sigma) const {
  if (ndof < 1 || ndof > 2)
    throw std::invalid_argument("ChiSquareLevels: ndof must be 1 or 2, got " + std::to_string(ndof));
  if (sigma < 1 || sigma > 2)
    throw std::invalid_argument("ChiSquareLevels: sigma must be 1 or 2, got " + std::to_string(sigma));
  return levels_[ndof - 1][sigma - 1];
}

const ChiSquareLevels& ChiSquareLevels::Default() {
  static const ChiSquareLevels levels;
  return levels;
}

void ChiSquareLevels::validate_row_(const std::array<double, 2>& row, int ndof) {
  const std::string tag = "ChiSquareLevels: ndof=" + std::to_string(ndof);
  for (double v : row) {
    if (!std::isfinite(v) || v <= 0.0)
      throw std::invalid_argument(tag + " levels must be finite and > 0");
  }
  if (row[1] <= row[0])
    throw std::invalid_argument(tag + " levels must increase with sigma");
}

} // namespace nllscan::stats
