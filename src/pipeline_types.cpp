#include "pipeline_types.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace dbforecast {

static void requireRows(const char* what, Eigen::Index rows, std::size_t T) {
  if (static_cast<std::size_t>(rows) != T) {
    std::ostringstream oss;
    oss << what << " has " << rows << " rows, expected " << T;
    throw std::invalid_argument(oss.str());
  }
}

static void requireShapes(std::size_t T, const Eigen::MatrixXd& azimuth, const Eigen::MatrixXd& polar,
                          const ComponentArrays& targets) {
  requireRows("azimuth", azimuth.rows(), T);
  requireRows("polar", polar.rows(), T);
  if (azimuth.cols() != polar.cols()) {
    std::ostringstream oss;
    oss << "azimuth has " << azimuth.cols() << " stations, polar has " << polar.cols();
    throw std::invalid_argument(oss.str());
  }
  for (const auto& kv : targets) {
    requireRows(kv.first.c_str(), kv.second.rows(), T);
    if (kv.second.cols() != azimuth.cols()) {
      std::ostringstream oss;
      oss << "target '" << kv.first << "' has " << kv.second.cols()
          << " stations, coordinates have " << azimuth.cols();
      throw std::invalid_argument(oss.str());
    }
  }
}

void validateBatch(const Batch& batch) {
  const std::size_t T = batch.size();
  if (batch.solar_wind.size() > 0) requireRows("solar_wind", batch.solar_wind.rows(), T);
  requireShapes(T, batch.azimuth, batch.polar, batch.targets);
}

void validateMetadata(const BatchMetadata& md) {
  requireShapes(md.times.size(), md.azimuth, md.polar, md.targets);
}

BatchMetadata metadataFromBatch(const Batch& batch) {
  BatchMetadata md;
  md.times = batch.times;
  md.azimuth = batch.azimuth;
  md.polar = batch.polar;
  md.targets = batch.targets;
  return md;
}

TableDataSource::TableDataSource(StationTable table, std::size_t batch_size)
    : table_(std::move(table)), batch_size_(batch_size) {
  if (batch_size_ == 0) {
    throw std::invalid_argument("batch size must be positive");
  }
  validateBatch(table_);
}

std::size_t TableDataSource::batchCount() const {
  return (table_.size() + batch_size_ - 1) / batch_size_;
}

bool TableDataSource::next(Batch& out) {
  const std::size_t N = table_.size();
  if (cursor_ >= N) return false;

  const std::size_t T = std::min(batch_size_, N - cursor_);
  const Eigen::Index r0 = static_cast<Eigen::Index>(cursor_);
  const Eigen::Index nr = static_cast<Eigen::Index>(T);

  out.times.assign(table_.times.begin() + static_cast<std::ptrdiff_t>(cursor_),
                   table_.times.begin() + static_cast<std::ptrdiff_t>(cursor_ + T));
  if (table_.solar_wind.size() > 0) {
    out.solar_wind = table_.solar_wind.middleRows(r0, nr);
  } else {
    out.solar_wind.resize(nr, 0);
  }
  out.azimuth = table_.azimuth.middleRows(r0, nr);
  out.polar = table_.polar.middleRows(r0, nr);
  out.targets.clear();
  for (const auto& kv : table_.targets) {
    out.targets[kv.first] = kv.second.middleRows(r0, nr);
  }

  cursor_ += T;
  return true;
}

}  // namespace dbforecast
