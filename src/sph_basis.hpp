#pragma once

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace dbforecast {

enum class Family {
  Cos,
  Sin
};

struct HarmonicTerm {
  int n = 0;   // degree
  int m = 0;   // order
  Family family = Family::Cos;
};

// One [Q, B] basis matrix per query set: the [query-batch, query-point, basis-function] array.
using BasisStack = std::vector<Eigen::MatrixXd>;

// Number of basis functions up to degree nmax: sum_{n=0}^{nmax} (2n+1).
int basisSize(int nmax);

// Canonical column order of the basis-function axis:
// ascending degree n, then ascending order m, cosine before sine;
// m = 0 carries the zonal (cosine) term only.
// Coefficient vectors must be laid out in this same order.
std::vector<HarmonicTerm> basisTerms(int nmax);

// Column of (n, m, family) in the canonical order. Throws std::invalid_argument
// for m > n or a sine term with m = 0.
int basisIndex(int n, int m, Family family);

std::string termLabel(const HarmonicTerm& t);

// Schmidt semi-normalized associated Legendre values P[n][m](cos(theta)), 0<=m<=n<=nmax.
// No Condon-Shortley phase.
std::vector<std::vector<double>> schmidtLegendre(int nmax, double theta);

// Basis evaluated at Q query points -> [Q, B].
// azimuth: MLT angle [rad], polar: colatitude [rad]. NaN inputs give NaN rows.
Eigen::MatrixXd basisMatrix(int nmax,
                            const Eigen::VectorXd& azimuth,
                            const Eigen::VectorXd& polar);

// Grid variant: points are taken column-major, Q = rows * cols.
Eigen::MatrixXd basisMatrixGrid(int nmax,
                                const Eigen::MatrixXd& azimuth,
                                const Eigen::MatrixXd& polar);

// One basis matrix per row of azimuth/polar [T, S] -> T matrices of [S, B].
BasisStack basisStack(int nmax,
                      const Eigen::MatrixXd& azimuth,
                      const Eigen::MatrixXd& polar);

// Coordinate helpers.
double mltToAzimuth(double mlt_hours);
double azimuthToMlt(double azimuth_rad);
double colatitudeToPolar(double colat_deg);
double polarToColatitude(double polar_rad);

}  // namespace dbforecast
