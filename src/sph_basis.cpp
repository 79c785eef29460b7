#include "sph_basis.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace dbforecast {

static constexpr double kPi = 3.14159265358979323846;

static void requireDegree(int nmax) {
  if (nmax < 1) {
    std::ostringstream oss;
    oss << "harmonic degree must be >= 1, got " << nmax;
    throw std::invalid_argument(oss.str());
  }
}

int basisSize(int nmax) {
  requireDegree(nmax);
  int count = 0;
  for (int n = 0; n <= nmax; ++n) {
    count += 2 * n + 1;
  }
  return count;
}

std::vector<HarmonicTerm> basisTerms(int nmax) {
  requireDegree(nmax);
  std::vector<HarmonicTerm> terms;
  terms.reserve(static_cast<std::size_t>(basisSize(nmax)));
  for (int n = 0; n <= nmax; ++n) {
    for (int m = 0; m <= n; ++m) {
      terms.push_back({n, m, Family::Cos});
      if (m != 0) terms.push_back({n, m, Family::Sin});
    }
  }
  return terms;
}

int basisIndex(int n, int m, Family family) {
  if (n < 0 || m < 0 || m > n) {
    std::ostringstream oss;
    oss << "invalid harmonic (n=" << n << ", m=" << m << ")";
    throw std::invalid_argument(oss.str());
  }
  if (m == 0 && family == Family::Sin) {
    throw std::invalid_argument("order 0 has no sine term");
  }
  // Degrees below n occupy n^2 columns; within degree n, order m starts at 2m-1 (m>0).
  int idx = n * n;
  if (m > 0) idx += 2 * m - 1 + (family == Family::Sin ? 1 : 0);
  return idx;
}

std::string termLabel(const HarmonicTerm& t) {
  std::ostringstream oss;
  oss << (t.family == Family::Cos ? "c" : "s") << "_" << t.n << "_" << t.m;
  return oss.str();
}

std::vector<std::vector<double>> schmidtLegendre(int nmax, double theta) {
  std::vector<std::vector<double>> P(nmax + 1, std::vector<double>(nmax + 1, 0.0));

  const double cos_t = std::cos(theta);
  const double sin_t = std::sin(theta);

  P[0][0] = 1.0;
  for (int m = 0; m <= nmax; ++m) {
    // Sectoral term
    if (m == 1) {
      P[1][1] = sin_t;
    } else if (m > 1) {
      P[m][m] = std::sqrt((2.0 * m - 1.0) / (2.0 * m)) * sin_t * P[m - 1][m - 1];
    }

    for (int n = m + 1; n <= nmax; ++n) {
      const double P2 = (n - 2 >= m) ? P[n - 2][m] : 0.0;
      const double K = std::sqrt((n - 1.0) * (n - 1.0) - static_cast<double>(m) * m);
      P[n][m] = ((2.0 * n - 1.0) * cos_t * P[n - 1][m] - K * P2) /
                std::sqrt(static_cast<double>(n) * n - static_cast<double>(m) * m);
    }
  }
  return P;
}

static void fillRow(int nmax, double phi, double theta, Eigen::MatrixXd& out, Eigen::Index q) {
  const std::vector<std::vector<double>> P = schmidtLegendre(nmax, theta);

  int col = 0;
  for (int n = 0; n <= nmax; ++n) {
    for (int m = 0; m <= n; ++m) {
      out(q, col++) = P[n][m] * std::cos(m * phi);
      if (m != 0) {
        out(q, col++) = P[n][m] * std::sin(m * phi);
      }
    }
  }
}

Eigen::MatrixXd basisMatrix(int nmax,
                            const Eigen::VectorXd& azimuth,
                            const Eigen::VectorXd& polar) {
  const int B = basisSize(nmax);
  if (azimuth.size() != polar.size()) {
    std::ostringstream oss;
    oss << "azimuth and polar sizes differ: " << azimuth.size() << " vs " << polar.size();
    throw std::invalid_argument(oss.str());
  }

  Eigen::MatrixXd out(azimuth.size(), B);
  for (Eigen::Index q = 0; q < azimuth.size(); ++q) {
    fillRow(nmax, azimuth(q), polar(q), out, q);
  }
  return out;
}

Eigen::MatrixXd basisMatrixGrid(int nmax,
                                const Eigen::MatrixXd& azimuth,
                                const Eigen::MatrixXd& polar) {
  if (azimuth.rows() != polar.rows() || azimuth.cols() != polar.cols()) {
    std::ostringstream oss;
    oss << "azimuth grid " << azimuth.rows() << "x" << azimuth.cols()
        << " does not match polar grid " << polar.rows() << "x" << polar.cols();
    throw std::invalid_argument(oss.str());
  }
  const Eigen::VectorXd az = Eigen::Map<const Eigen::VectorXd>(azimuth.data(), azimuth.size());
  const Eigen::VectorXd po = Eigen::Map<const Eigen::VectorXd>(polar.data(), polar.size());
  return basisMatrix(nmax, az, po);
}

BasisStack basisStack(int nmax,
                      const Eigen::MatrixXd& azimuth,
                      const Eigen::MatrixXd& polar) {
  if (azimuth.rows() != polar.rows() || azimuth.cols() != polar.cols()) {
    std::ostringstream oss;
    oss << "azimuth " << azimuth.rows() << "x" << azimuth.cols()
        << " does not match polar " << polar.rows() << "x" << polar.cols();
    throw std::invalid_argument(oss.str());
  }

  BasisStack stack;
  stack.reserve(static_cast<std::size_t>(azimuth.rows()));
  for (Eigen::Index t = 0; t < azimuth.rows(); ++t) {
    stack.push_back(basisMatrix(nmax,
                                Eigen::VectorXd(azimuth.row(t).transpose()),
                                Eigen::VectorXd(polar.row(t).transpose())));
  }
  return stack;
}

double mltToAzimuth(double mlt_hours) { return mlt_hours * kPi / 12.0; }
double azimuthToMlt(double azimuth_rad) { return azimuth_rad * 12.0 / kPi; }
double colatitudeToPolar(double colat_deg) { return colat_deg * kPi / 180.0; }
double polarToColatitude(double polar_rad) { return polar_rad * 180.0 / kPi; }

}  // namespace dbforecast
