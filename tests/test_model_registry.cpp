#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

#include "model_registry.hpp"
#include "models.hpp"
#include "sph_basis.hpp"
#include "time_utils.hpp"

using namespace dbforecast;

namespace {

Batch twoStepBatch() {
  Batch b;
  DateTime t0;
  t0.year = 2015; t0.month = 3; t0.day = 17; t0.hour = 4;
  DateTime t1 = t0;
  t1.minute = 1;
  b.times = {toJulianDateUTC(t0), toJulianDateUTC(t1)};
  b.solar_wind.resize(2, 2);
  b.solar_wind << 1.0, 2.0,
                  -1.0, 0.5;
  b.azimuth = Eigen::MatrixXd::Constant(2, 1, 0.5);
  b.polar = Eigen::MatrixXd::Constant(2, 1, 0.3);
  b.targets["dbn"] = Eigen::MatrixXd::Zero(2, 1);
  b.targets["dbe"] = Eigen::MatrixXd::Zero(2, 1);
  return b;
}

class ConstantModel : public InferenceModel {
 public:
  explicit ConstantModel(int width) : width_(width) {}
  std::string name() const override { return "constant"; }
  Prediction predict(const Batch& batch) override {
    Prediction p;
    p.coefficients["dbn"] = Eigen::MatrixXd::Ones(static_cast<Eigen::Index>(batch.size()), width_);
    p.metadata = metadataFromBatch(batch);
    return p;
  }

 private:
  int width_ = 0;
};

}  // namespace

TEST(ModelRegistry, BuiltinsAreRegistered) {
  const ModelRegistry r = ModelRegistry::withBuiltins();
  EXPECT_TRUE(r.contains("replay"));
  EXPECT_TRUE(r.contains("Linear"));
  const auto names = r.names();
  EXPECT_NE(names.end(), std::find(names.begin(), names.end(), "replay"));
  EXPECT_NE(names.end(), std::find(names.begin(), names.end(), "linear"));
}

TEST(ModelRegistry, UnknownNameThrowsAndListsKnownNames) {
  const ModelRegistry r = ModelRegistry::withBuiltins();
  try {
    r.create("gru_mlp", ModelOptions{});
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument& e) {
    const std::string msg = e.what();
    EXPECT_NE(std::string::npos, msg.find("gru_mlp"));
    EXPECT_NE(std::string::npos, msg.find("replay"));
  }
}

TEST(ModelRegistry, BuiltinFactoryReportsMissingFile) {
  const ModelRegistry r = ModelRegistry::withBuiltins();
  ModelOptions o;
  o.file = "/nonexistent/dbforecast/coefficients.txt";
  o.nmax = 2;
  EXPECT_THROW(r.create("replay", o), std::runtime_error);
  EXPECT_THROW(r.create("linear", o), std::runtime_error);
}

TEST(ModelRegistry, CustomFactoryResolvesByName) {
  ModelRegistry r;
  r.add("constant", [](const ModelOptions& o) -> std::unique_ptr<InferenceModel> {
    return std::make_unique<ConstantModel>(basisSize(o.nmax));
  });
  ModelOptions o;
  o.nmax = 3;
  std::unique_ptr<InferenceModel> m = r.create("CONSTANT", o);
  ASSERT_TRUE(m);
  EXPECT_EQ("constant", m->name());
  const Prediction p = m->predict(twoStepBatch());
  EXPECT_EQ(basisSize(3), p.coefficients.at("dbn").cols());
}

TEST(ReplayModel, LoadsFromFileAndFillsGapsWithNaN) {
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() / "dbforecast_replay_test.txt";
  {
    std::ofstream ofs(path);
    ofs << "# component time c0..c3\n"
        << "dbn 2015-03-17T04:00:00 1 2 3 4\n"
        << "dbe 2015-03-17T04:00:00 -1 -2 -3 -4\n"
        << "dbe 2015-03-17 04:01:00 5 6 7 8\n";
  }

  ModelOptions o;
  o.file = path;
  o.nmax = 1;
  std::unique_ptr<InferenceModel> m = ModelRegistry::withBuiltins().create("replay", o);
  const Prediction p = m->predict(twoStepBatch());

  const Eigen::MatrixXd& dbn = p.coefficients.at("dbn");
  const Eigen::MatrixXd& dbe = p.coefficients.at("dbe");
  ASSERT_EQ(2, dbn.rows());
  ASSERT_EQ(4, dbn.cols());
  EXPECT_DOUBLE_EQ(3.0, dbn(0, 2));
  EXPECT_TRUE(std::isnan(dbn(1, 0)));
  EXPECT_DOUBLE_EQ(-4.0, dbe(0, 3));
  EXPECT_DOUBLE_EQ(5.0, dbe(1, 0));
  EXPECT_EQ(2u, p.metadata.times.size());

  std::filesystem::remove(path);
}

TEST(ReplayModel, RejectsWrongVectorLength) {
  ReplayModel m(basisSize(1));
  EXPECT_THROW(m.add("dbn", 2457000.5, Eigen::RowVectorXd::Zero(9)), std::invalid_argument);
}

TEST(LinearModel, AffineReadoutOfSolarWind) {
  const int B = basisSize(1);
  LinearModel m(B);
  Eigen::MatrixXd W = Eigen::MatrixXd::Zero(B, 2);
  Eigen::VectorXd b = Eigen::VectorXd::Zero(B);
  W(0, 0) = 2.0;
  W(0, 1) = 1.0;
  W(3, 1) = -4.0;
  b(0) = 0.5;
  m.set("dbn", W, b);

  const Prediction p = m.predict(twoStepBatch());
  const Eigen::MatrixXd& c = p.coefficients.at("dbn");
  ASSERT_EQ(2, c.rows());
  EXPECT_DOUBLE_EQ(2.0 * 1.0 + 2.0 + 0.5, c(0, 0));
  EXPECT_DOUBLE_EQ(-2.0 + 0.5 + 0.5, c(1, 0));
  EXPECT_DOUBLE_EQ(-8.0, c(0, 3));
  EXPECT_DOUBLE_EQ(0.0, c(1, 1));

  EXPECT_THROW(m.set("dbe", Eigen::MatrixXd::Zero(3, 2), Eigen::VectorXd::Zero(3)), std::invalid_argument);

  Batch wrong = twoStepBatch();
  wrong.solar_wind = Eigen::MatrixXd::Zero(2, 5);
  EXPECT_THROW(m.predict(wrong), std::invalid_argument);
}

TEST(LinearModel, LoadsWeightsFile) {
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() / "dbforecast_linear_test.txt";
  {
    std::ofstream ofs(path);
    ofs << "# component row b w0 w1\n";
    for (int row = 0; row < 4; ++row) {
      ofs << "dbe " << row << " " << row << " 1 0\n";
    }
  }

  LinearModel m(basisSize(1));
  ASSERT_TRUE(m.load(path.string()));
  EXPECT_EQ(std::vector<std::string>{"dbe"}, m.components());
  const Prediction p = m.predict(twoStepBatch());
  EXPECT_DOUBLE_EQ(1.0 + 3.0, p.coefficients.at("dbe")(0, 3));
  EXPECT_DOUBLE_EQ(-1.0 + 2.0, p.coefficients.at("dbe")(1, 2));

  std::filesystem::remove(path);
}
