#include "grid_forecast.hpp"

#include <sstream>
#include <stdexcept>

#include "sph_basis.hpp"

namespace dbforecast {

Grid regularGrid(int n_mlt, int n_colat, double max_colat_deg) {
  if (n_mlt < 1 || n_colat < 1) {
    std::ostringstream oss;
    oss << "grid dimensions must be positive, got " << n_mlt << "x" << n_colat;
    throw std::invalid_argument(oss.str());
  }

  Grid g;
  g.azimuth.resize(n_colat, n_mlt);
  g.polar.resize(n_colat, n_mlt);
  for (int i = 0; i < n_colat; ++i) {
    const double colat = (n_colat == 1) ? 0.0 : max_colat_deg * i / (n_colat - 1.0);
    for (int j = 0; j < n_mlt; ++j) {
      const double mlt = 24.0 * j / n_mlt;
      g.azimuth(i, j) = mltToAzimuth(mlt);
      g.polar(i, j) = colatitudeToPolar(colat);
    }
  }
  return g;
}

GridForecaster::GridForecaster(int nmax, const Grid& grid, Precision precision)
    : nmax_(nmax), grid_(grid), precision_(precision) {
  basis_ = basisMatrixGrid(nmax_, grid_.azimuth, grid_.polar);
}

Eigen::MatrixXd GridForecaster::evaluate(const Eigen::RowVectorXd& coefficients,
                                         const Scaler& scaler) const {
  const Eigen::MatrixXd values = contract(basis_, Eigen::MatrixXd(coefficients), precision_);  // [Q, 1]
  const Eigen::MatrixXd physical = destandardize(values, scaler);
  // Undo the column-major flattening used when the basis was built.
  return Eigen::Map<const Eigen::MatrixXd>(physical.data(), grid_.azimuth.rows(), grid_.azimuth.cols());
}

}  // namespace dbforecast
