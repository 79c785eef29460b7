#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "contraction.hpp"
#include "sph_basis.hpp"

using namespace dbforecast;

namespace {

Eigen::MatrixXd sampleBasis(int nmax, int points) {
  const Eigen::VectorXd az = Eigen::VectorXd::LinSpaced(points, 0.0, 5.5);
  const Eigen::VectorXd po = Eigen::VectorXd::LinSpaced(points, 0.2, 2.9);
  return basisMatrix(nmax, az, po);
}

}  // namespace

TEST(Contraction, ZeroCoefficientsGiveZeroField) {
  const Eigen::MatrixXd B = sampleBasis(4, 7);
  const Eigen::MatrixXd C = Eigen::MatrixXd::Zero(3, basisSize(4));
  const Eigen::MatrixXd F = contract(B, C);
  ASSERT_EQ(7, F.rows());
  ASSERT_EQ(3, F.cols());
  EXPECT_TRUE((F.array() == 0.0).all());
}

TEST(Contraction, MatchesMatrixProduct) {
  const Eigen::MatrixXd B = sampleBasis(6, 11);
  const Eigen::MatrixXd C = Eigen::MatrixXd::Random(5, basisSize(6));
  const Eigen::MatrixXd F = contract(B, C);
  const Eigen::MatrixXd ref = B * C.transpose();
  EXPECT_TRUE(F.isApprox(ref, 1e-12));
}

TEST(Contraction, BasisWidthMismatchThrows) {
  const Eigen::MatrixXd B = sampleBasis(3, 4);
  const Eigen::MatrixXd C = Eigen::MatrixXd::Ones(2, basisSize(4));
  EXPECT_THROW(contract(B, C), std::invalid_argument);

  BasisStack stack = {B, B};
  EXPECT_THROW(contract(stack, C), std::invalid_argument);
  EXPECT_THROW(contractPerStep(stack, C), std::invalid_argument);
}

TEST(Contraction, MismatchMessageNamesBothSizes) {
  const Eigen::MatrixXd B = sampleBasis(1, 2);
  const Eigen::MatrixXd C = Eigen::MatrixXd::Ones(1, 9);
  try {
    contract(B, C);
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument& e) {
    const std::string msg = e.what();
    EXPECT_NE(std::string::npos, msg.find("4"));
    EXPECT_NE(std::string::npos, msg.find("9"));
  }
}

TEST(Contraction, BatchedFormContractsEverySet) {
  BasisStack stack = {sampleBasis(2, 3), sampleBasis(2, 5)};
  const Eigen::MatrixXd C = Eigen::MatrixXd::Random(4, basisSize(2));
  const std::vector<Eigen::MatrixXd> out = contract(stack, C);
  ASSERT_EQ(2u, out.size());
  EXPECT_EQ(3, out[0].rows());
  EXPECT_EQ(5, out[1].rows());
  EXPECT_EQ(4, out[1].cols());
  EXPECT_TRUE(out[1].isApprox(stack[1] * C.transpose(), 1e-12));
}

TEST(Contraction, PerStepPairsBasisWithCoefficientRow) {
  Eigen::MatrixXd az(2, 3);
  Eigen::MatrixXd po(2, 3);
  az << 0.1, 1.0, 2.0,
        3.0, 4.0, 5.0;
  po << 0.3, 0.6, 0.9,
        1.2, 1.5, 1.8;
  const BasisStack stack = basisStack(3, az, po);
  const Eigen::MatrixXd C = Eigen::MatrixXd::Random(2, basisSize(3));

  const Eigen::MatrixXd F = contractPerStep(stack, C);
  ASSERT_EQ(2, F.rows());
  ASSERT_EQ(3, F.cols());
  for (Eigen::Index t = 0; t < 2; ++t) {
    const Eigen::VectorXd expected = stack[static_cast<std::size_t>(t)] * C.row(t).transpose();
    for (Eigen::Index q = 0; q < 3; ++q) {
      EXPECT_NEAR(expected(q), F(t, q), 1e-12);
    }
  }

  EXPECT_THROW(contractPerStep(stack, Eigen::MatrixXd::Zero(3, basisSize(3))), std::invalid_argument);
}

TEST(Contraction, MissingStationPropagatesAsNaN) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  Eigen::MatrixXd az(1, 3);
  Eigen::MatrixXd po(1, 3);
  az << 0.5, nan, 2.5;
  po << 0.4, nan, 0.8;
  const Eigen::MatrixXd C = Eigen::MatrixXd::Ones(1, basisSize(2));

  const Eigen::MatrixXd F = contractPerStep(basisStack(2, az, po), C);
  EXPECT_TRUE(std::isfinite(F(0, 0)));
  EXPECT_TRUE(std::isnan(F(0, 1)));
  EXPECT_TRUE(std::isfinite(F(0, 2)));
}

TEST(Contraction, SinglePrecisionStaysCloseToDouble) {
  const Eigen::MatrixXd B = sampleBasis(12, 20);
  const Eigen::MatrixXd C = Eigen::MatrixXd::Random(3, basisSize(12));
  const Eigen::MatrixXd d = contract(B, C, Precision::Double);
  const Eigen::MatrixXd s = contract(B, C, Precision::Single);
  const double scale = d.cwiseAbs().maxCoeff();
  EXPECT_LT((d - s).cwiseAbs().maxCoeff(), 1e-4 * scale);
}

TEST(Contraction, PrecisionNames) {
  EXPECT_EQ(Precision::Double, precisionFromString("double"));
  EXPECT_EQ(Precision::Single, precisionFromString("Single"));
  EXPECT_EQ(Precision::Single, precisionFromString("float32"));
  EXPECT_EQ("double", precisionToString(Precision::Double));
  EXPECT_THROW(precisionFromString("half"), std::invalid_argument);
}
