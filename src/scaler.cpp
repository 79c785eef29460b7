#include "scaler.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace dbforecast {

Eigen::MatrixXd destandardize(const Eigen::MatrixXd& values, const Scaler& s) {
  return destandardize(values, s.mean, s.stddev);
}

Eigen::MatrixXd destandardize(const Eigen::MatrixXd& values, double mean, double stddev) {
  return (values.array() * stddev + mean).matrix();
}

Eigen::MatrixXd standardize(const Eigen::MatrixXd& values, const Scaler& s) {
  return ((values.array() - s.mean) / s.stddev).matrix();
}

bool ScalerSet::load(const std::string& file) {
  std::ifstream ifs(file);
  if (!ifs.is_open()) return false;

  std::map<std::string, Scaler> parsed;
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty() || line[0] == '#') continue;
    std::istringstream iss(line);
    std::string name;
    Scaler s;
    if (!(iss >> name >> s.mean >> s.stddev)) {
      continue;
    }
    parsed[name] = s;
  }
  if (parsed.empty()) return false;

  scalers_ = std::move(parsed);
  return true;
}

bool ScalerSet::contains(const std::string& component) const {
  return scalers_.find(component) != scalers_.end();
}

const Scaler& ScalerSet::at(const std::string& component) const {
  auto it = scalers_.find(component);
  if (it == scalers_.end()) {
    throw std::out_of_range("no scaler for component '" + component + "'");
  }
  return it->second;
}

std::vector<std::string> ScalerSet::components() const {
  std::vector<std::string> out;
  out.reserve(scalers_.size());
  for (const auto& kv : scalers_) out.push_back(kv.first);
  return out;
}

}  // namespace dbforecast
