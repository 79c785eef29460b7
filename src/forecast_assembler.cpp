#include "forecast_assembler.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "sph_basis.hpp"

namespace dbforecast {

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

ForecastAssembler::ForecastAssembler(ForecastConfig config, ScalerSet scalers)
    : config_(std::move(config)), scalers_(std::move(scalers)) {
  basis_width_ = basisSize(config_.nmax);  // validates nmax
  if (config_.max_stations == 0) {
    throw std::invalid_argument("max_stations must be positive");
  }
  if (config_.components.empty()) {
    throw std::invalid_argument("no target components configured");
  }
  for (const auto& c : config_.components) {
    if (!scalers_.contains(c)) {
      throw std::invalid_argument("no scaler for component '" + c + "'");
    }
  }
}

struct ForecastAssembler::SeriesParts {
  std::vector<Eigen::MatrixXd> predictions;
  std::vector<Eigen::MatrixXd> targets;
  std::vector<Eigen::MatrixXd> azimuth;
  std::vector<Eigen::MatrixXd> polar;
  std::vector<Eigen::MatrixXd> coefficients;
  std::vector<double> times;
};

// Stack blocks top to bottom into a NaN-filled [rows, cols] matrix.
// Blocks narrower than `cols` occupy the leading columns.
static Eigen::MatrixXd stackRows(const std::vector<Eigen::MatrixXd>& blocks, Eigen::Index rows,
                                 Eigen::Index cols) {
  Eigen::MatrixXd out = Eigen::MatrixXd::Constant(rows, cols, kNaN);
  Eigen::Index r = 0;
  for (const auto& b : blocks) {
    out.block(r, 0, b.rows(), b.cols()) = b;
    r += b.rows();
  }
  return out;
}

static void checkMetadata(const BatchMetadata& md, std::size_t batch_index) {
  try {
    validateMetadata(md);
  } catch (const std::invalid_argument& e) {
    std::ostringstream oss;
    oss << "batch " << batch_index << ": inconsistent prediction metadata: " << e.what();
    throw std::invalid_argument(oss.str());
  }
}

ForecastResult ForecastAssembler::run(DataSource& source, InferenceModel& model) const {
  const Eigen::Index S = static_cast<Eigen::Index>(config_.max_stations);

  std::map<std::string, SeriesParts> parts;
  for (const auto& c : config_.components) parts[c];

  source.reset();

  Batch batch;
  std::size_t batch_index = 0;
  while (source.next(batch)) {
    validateBatch(batch);
    const Prediction pred = model.predict(batch);
    appendBatch(pred, batch_index, parts);
    ++batch_index;
  }

  ForecastResult result;
  for (auto& kv : parts) {
    SeriesParts& p = kv.second;
    const Eigen::Index N = static_cast<Eigen::Index>(p.times.size());
    ComponentSeries& s = result[kv.first];
    s.predictions = stackRows(p.predictions, N, S);
    s.targets = stackRows(p.targets, N, S);
    s.azimuth = stackRows(p.azimuth, N, S);
    s.polar = stackRows(p.polar, N, S);
    s.coefficients = stackRows(p.coefficients, N, basis_width_);
    s.times = std::move(p.times);
  }
  return result;
}

void ForecastAssembler::appendBatch(const Prediction& pred, std::size_t batch_index,
                                    std::map<std::string, SeriesParts>& parts) const {
  const BatchMetadata& md = pred.metadata;
  checkMetadata(md, batch_index);

  const std::size_t T = md.times.size();
  if (T == 0) return;

  const Eigen::Index stations = md.azimuth.cols();
  if (static_cast<std::size_t>(stations) > config_.max_stations) {
    std::ostringstream oss;
    oss << "batch " << batch_index << " has " << stations
        << " station columns, capacity is " << config_.max_stations;
    throw std::invalid_argument(oss.str());
  }

  // Station sets differ per timestep, so one basis matrix per timestep.
  const BasisStack basis = basisStack(config_.nmax, md.azimuth, md.polar);

  const Eigen::Index nr = static_cast<Eigen::Index>(T);

  for (const auto& c : config_.components) {
    auto cit = pred.coefficients.find(c);
    if (cit == pred.coefficients.end()) {
      std::ostringstream oss;
      oss << "batch " << batch_index << ": prediction has no coefficients for component '" << c << "'";
      throw std::invalid_argument(oss.str());
    }
    const Eigen::MatrixXd& coeffs = cit->second;
    if (coeffs.rows() != nr || coeffs.cols() != basis_width_) {
      std::ostringstream oss;
      oss << "batch " << batch_index << ", component '" << c << "': coefficients are "
          << coeffs.rows() << "x" << coeffs.cols() << ", expected " << nr << "x" << basis_width_;
      throw std::invalid_argument(oss.str());
    }

    auto tit = md.targets.find(c);
    if (tit == md.targets.end()) {
      std::ostringstream oss;
      oss << "batch " << batch_index << ": no target values for component '" << c << "'";
      throw std::invalid_argument(oss.str());
    }

    const Scaler& scaler = scalers_.at(c);
    const Eigen::MatrixXd raw = contractPerStep(basis, coeffs, config_.precision);

    SeriesParts& p = parts[c];
    p.predictions.push_back(destandardize(raw, scaler));
    p.targets.push_back(destandardize(tit->second, scaler));
    p.azimuth.push_back(md.azimuth);
    p.polar.push_back(md.polar);
    p.coefficients.push_back(coeffs);
    p.times.insert(p.times.end(), md.times.begin(), md.times.end());
  }
}

}  // namespace dbforecast
