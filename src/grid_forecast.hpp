#pragma once

#include <Eigen/Dense>

#include "contraction.hpp"
#include "scaler.hpp"

namespace dbforecast {

struct Grid {
  Eigen::MatrixXd azimuth;   // [n_colat, n_mlt] rad
  Eigen::MatrixXd polar;     // [n_colat, n_mlt] rad
};

// Regular MLT x colatitude grid: n_mlt points over [0, 24) h,
// n_colat points over [0, max_colat_deg].
Grid regularGrid(int n_mlt, int n_colat, double max_colat_deg);

// Fixed query grid: the basis is built once and reused for every timestep.
class GridForecaster {
 public:
  GridForecaster(int nmax, const Grid& grid, Precision precision = Precision::Double);

  // De-standardized field on the grid for one coefficient vector; same shape as the grid.
  Eigen::MatrixXd evaluate(const Eigen::RowVectorXd& coefficients, const Scaler& scaler) const;

  int nmax() const { return nmax_; }
  const Grid& grid() const { return grid_; }
  const Eigen::MatrixXd& basis() const { return basis_; }

 private:
  int nmax_ = 1;
  Grid grid_;
  Precision precision_ = Precision::Double;
  Eigen::MatrixXd basis_;    // [Q, B], Q = rows * cols of the grid
};

}  // namespace dbforecast
