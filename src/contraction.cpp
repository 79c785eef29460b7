#include "contraction.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace dbforecast {

Precision precisionFromString(const std::string& s) {
  std::string t;
  t.reserve(s.size());
  for (char c : s) {
    t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (t == "double" || t == "float64" || t == "f64") return Precision::Double;
  if (t == "single" || t == "float32" || t == "f32") return Precision::Single;
  throw std::invalid_argument("unknown precision '" + s + "' (expected double|single)");
}

std::string precisionToString(Precision p) {
  switch (p) {
    case Precision::Double: return "double";
    case Precision::Single: return "single";
    default: return "double";
  }
}

static void requireSameWidth(Eigen::Index basis_cols, Eigen::Index coeff_cols) {
  if (basis_cols != coeff_cols) {
    std::ostringstream oss;
    oss << "basis-function count mismatch: basis has " << basis_cols
        << " columns, coefficients have " << coeff_cols;
    throw std::invalid_argument(oss.str());
  }
}

// Dot product over the basis axis in ascending index order.
template <typename Scalar>
static double dotRows(const Eigen::MatrixXd& a, Eigen::Index ra,
                      const Eigen::MatrixXd& b, Eigen::Index rb) {
  Scalar sum = Scalar(0);
  for (Eigen::Index k = 0; k < a.cols(); ++k) {
    sum += static_cast<Scalar>(a(ra, k)) * static_cast<Scalar>(b(rb, k));
  }
  return static_cast<double>(sum);
}

static double dot(const Eigen::MatrixXd& a, Eigen::Index ra,
                  const Eigen::MatrixXd& b, Eigen::Index rb,
                  Precision precision) {
  if (precision == Precision::Single) return dotRows<float>(a, ra, b, rb);
  return dotRows<double>(a, ra, b, rb);
}

Eigen::MatrixXd contract(const Eigen::MatrixXd& basis,
                         const Eigen::MatrixXd& coefficients,
                         Precision precision) {
  requireSameWidth(basis.cols(), coefficients.cols());

  Eigen::MatrixXd out(basis.rows(), coefficients.rows());
  for (Eigen::Index t = 0; t < coefficients.rows(); ++t) {
    for (Eigen::Index q = 0; q < basis.rows(); ++q) {
      out(q, t) = dot(basis, q, coefficients, t, precision);
    }
  }
  return out;
}

std::vector<Eigen::MatrixXd> contract(const BasisStack& basis,
                                      const Eigen::MatrixXd& coefficients,
                                      Precision precision) {
  std::vector<Eigen::MatrixXd> out;
  out.reserve(basis.size());
  for (const auto& b : basis) {
    out.push_back(contract(b, coefficients, precision));
  }
  return out;
}

Eigen::MatrixXd contractPerStep(const BasisStack& basis,
                                const Eigen::MatrixXd& coefficients,
                                Precision precision) {
  const Eigen::Index T = coefficients.rows();
  if (static_cast<Eigen::Index>(basis.size()) != T) {
    std::ostringstream oss;
    oss << "timestep mismatch: " << basis.size() << " basis matrices, "
        << T << " coefficient rows";
    throw std::invalid_argument(oss.str());
  }
  if (T == 0) return Eigen::MatrixXd(0, 0);

  const Eigen::Index Q = basis.front().rows();
  Eigen::MatrixXd out(T, Q);
  for (Eigen::Index t = 0; t < T; ++t) {
    const Eigen::MatrixXd& b = basis[static_cast<std::size_t>(t)];
    requireSameWidth(b.cols(), coefficients.cols());
    if (b.rows() != Q) {
      std::ostringstream oss;
      oss << "query-point mismatch at step " << t << ": " << b.rows() << " vs " << Q;
      throw std::invalid_argument(oss.str());
    }
    for (Eigen::Index q = 0; q < Q; ++q) {
      out(t, q) = dot(b, q, coefficients, t, precision);
    }
  }
  return out;
}

}  // namespace dbforecast
