#include "models.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "time_utils.hpp"

namespace dbforecast {

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

static bool isComment(const std::string& line) {
  const auto p = line.find_first_not_of(" \t\r");
  return p == std::string::npos || line[p] == '#';
}

// ---------------------------------------------------------------------------
// ReplayModel

bool ReplayModel::load(const std::string& file) {
  std::ifstream ifs(file);
  if (!ifs.is_open()) return false;

  std::map<std::string, std::map<long long, Eigen::RowVectorXd>> parsed;
  std::string line;
  while (std::getline(ifs, line)) {
    if (isComment(line)) continue;

    std::istringstream iss(line);
    std::string component;
    double jd = 0.0;
    if (!(iss >> component)) continue;
    if (!readTimestampToken(iss, jd)) continue;

    std::vector<double> v;
    double x;
    while (iss >> x) v.push_back(x);
    if (static_cast<int>(v.size()) != basis_width_) {
      return false;
    }
    parsed[component][julianMillis(jd)] = Eigen::Map<const Eigen::RowVectorXd>(v.data(), basis_width_);
  }
  if (parsed.empty()) return false;

  table_ = std::move(parsed);
  return true;
}

void ReplayModel::add(const std::string& component, double jd, const Eigen::RowVectorXd& coefficients) {
  if (coefficients.size() != basis_width_) {
    std::ostringstream oss;
    oss << "coefficient vector has " << coefficients.size() << " entries, expected " << basis_width_;
    throw std::invalid_argument(oss.str());
  }
  table_[component][julianMillis(jd)] = coefficients;
}

Prediction ReplayModel::predict(const Batch& batch) {
  const Eigen::Index T = static_cast<Eigen::Index>(batch.size());

  Prediction p;
  for (const auto& kv : table_) {
    Eigen::MatrixXd coeffs = Eigen::MatrixXd::Constant(T, basis_width_, kNaN);
    for (Eigen::Index t = 0; t < T; ++t) {
      auto it = kv.second.find(julianMillis(batch.times[static_cast<std::size_t>(t)]));
      if (it != kv.second.end()) coeffs.row(t) = it->second;
    }
    p.coefficients[kv.first] = std::move(coeffs);
  }
  p.metadata = metadataFromBatch(batch);
  return p;
}

std::vector<std::string> ReplayModel::components() const {
  std::vector<std::string> out;
  for (const auto& kv : table_) out.push_back(kv.first);
  return out;
}

// ---------------------------------------------------------------------------
// LinearModel

bool LinearModel::load(const std::string& file) {
  std::ifstream ifs(file);
  if (!ifs.is_open()) return false;

  // component -> row -> (b, w)
  std::map<std::string, std::map<int, std::pair<double, std::vector<double>>>> rows;
  std::string line;
  std::size_t n_features = 0;
  while (std::getline(ifs, line)) {
    if (isComment(line)) continue;

    std::istringstream iss(line);
    std::string component;
    int row = 0;
    double b = 0.0;
    if (!(iss >> component >> row >> b)) continue;

    std::vector<double> w;
    double x;
    while (iss >> x) w.push_back(x);
    if (w.empty()) continue;
    if (n_features == 0) n_features = w.size();
    if (w.size() != n_features || row < 0 || row >= basis_width_) return false;

    rows[component][row] = std::make_pair(b, std::move(w));
  }
  if (rows.empty()) return false;

  std::map<std::string, Readout> parsed;
  const Eigen::Index F = static_cast<Eigen::Index>(n_features);
  for (const auto& kv : rows) {
    if (static_cast<int>(kv.second.size()) != basis_width_) return false;
    Readout r;
    r.W.resize(basis_width_, F);
    r.b.resize(basis_width_);
    for (const auto& rv : kv.second) {
      r.b(rv.first) = rv.second.first;
      for (Eigen::Index f = 0; f < F; ++f) {
        r.W(rv.first, f) = rv.second.second[static_cast<std::size_t>(f)];
      }
    }
    parsed[kv.first] = std::move(r);
  }

  readouts_ = std::move(parsed);
  return true;
}

void LinearModel::set(const std::string& component, const Eigen::MatrixXd& W, const Eigen::VectorXd& b) {
  if (W.rows() != basis_width_ || b.size() != basis_width_) {
    std::ostringstream oss;
    oss << "readout for '" << component << "' is " << W.rows() << "x" << W.cols()
        << " with bias " << b.size() << ", expected " << basis_width_ << " rows";
    throw std::invalid_argument(oss.str());
  }
  readouts_[component] = Readout{W, b};
}

Prediction LinearModel::predict(const Batch& batch) {
  const Eigen::Index T = static_cast<Eigen::Index>(batch.size());

  Prediction p;
  for (const auto& kv : readouts_) {
    const Readout& r = kv.second;
    if (batch.solar_wind.cols() != r.W.cols() || batch.solar_wind.rows() != T) {
      std::ostringstream oss;
      oss << "solar-wind batch is " << batch.solar_wind.rows() << "x" << batch.solar_wind.cols()
          << ", readout '" << kv.first << "' expects " << T << "x" << r.W.cols();
      throw std::invalid_argument(oss.str());
    }
    // [T, F] * [F, B] + b^T
    Eigen::MatrixXd coeffs = batch.solar_wind * r.W.transpose();
    coeffs.rowwise() += r.b.transpose();
    p.coefficients[kv.first] = std::move(coeffs);
  }
  p.metadata = metadataFromBatch(batch);
  return p;
}

std::vector<std::string> LinearModel::components() const {
  std::vector<std::string> out;
  for (const auto& kv : readouts_) out.push_back(kv.first);
  return out;
}

}  // namespace dbforecast
