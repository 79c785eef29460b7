#pragma once

#include <Eigen/Dense>

#include <string>
#include <vector>

#include "sph_basis.hpp"

namespace dbforecast {

enum class Precision {
  Double,
  Single
};

// Throws std::invalid_argument for anything other than double|single.
Precision precisionFromString(const std::string& s);
std::string precisionToString(Precision p);

// Field values at every query point for every timestep.
// - basis: [Q, B]
// - coefficients: [T, B]
// Returns [Q, T]. Throws std::invalid_argument if the B axes differ.
Eigen::MatrixXd contract(const Eigen::MatrixXd& basis,
                         const Eigen::MatrixXd& coefficients,
                         Precision precision = Precision::Double);

// Batched form: one [Q, T] result per basis matrix in the stack.
std::vector<Eigen::MatrixXd> contract(const BasisStack& basis,
                                      const Eigen::MatrixXd& coefficients,
                                      Precision precision = Precision::Double);

// Pairs basis[t] with coefficients.row(t): out(t, q) = basis[t].row(q) . coefficients.row(t).
// All basis matrices must share Q. Returns [T, Q].
Eigen::MatrixXd contractPerStep(const BasisStack& basis,
                                const Eigen::MatrixXd& coefficients,
                                Precision precision = Precision::Double);

}  // namespace dbforecast
