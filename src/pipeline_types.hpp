#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace dbforecast {

// Per-component [T, S] arrays, keyed by component name ("dbn", "dbe", ...).
using ComponentArrays = std::map<std::string, Eigen::MatrixXd>;

// One batch of consecutive timesteps.
// Station columns keep a fixed meaning across batches; a station without data
// at a timestep has NaN coordinates and targets.
struct Batch {
  std::vector<double> times;       // Julian date per timestep
  Eigen::MatrixXd solar_wind;      // [T, F] upstream features (opaque to the core)
  Eigen::MatrixXd azimuth;         // [T, S] MLT angle [rad]
  Eigen::MatrixXd polar;           // [T, S] colatitude [rad]
  ComponentArrays targets;         // [T, S] standardized ground truth

  std::size_t size() const { return times.size(); }
};

// Time-ordered table that a TableDataSource slices into batches.
// Same layout as Batch, spanning the whole run.
using StationTable = Batch;

struct BatchMetadata {
  std::vector<double> times;
  Eigen::MatrixXd azimuth;
  Eigen::MatrixXd polar;
  ComponentArrays targets;
};

struct Prediction {
  ComponentArrays coefficients;    // [T, B] per component, canonical basis order
  BatchMetadata metadata;
};

// Produces batches in a stable, chronological order.
class DataSource {
 public:
  virtual ~DataSource() = default;

  // Fills `out` with the next batch. Returns false once exhausted.
  virtual bool next(Batch& out) = 0;

  // Rewind to the first batch.
  virtual void reset() = 0;
};

class TableDataSource : public DataSource {
 public:
  // batch_size == 0 is rejected with std::invalid_argument.
  TableDataSource(StationTable table, std::size_t batch_size);

  bool next(Batch& out) override;
  void reset() override { cursor_ = 0; }

  std::size_t batchCount() const;
  const StationTable& table() const { return table_; }

 private:
  StationTable table_;
  std::size_t batch_size_ = 1;
  std::size_t cursor_ = 0;
};

// Anything that maps a batch to per-timestep coefficient vectors.
class InferenceModel {
 public:
  virtual ~InferenceModel() = default;

  virtual std::string name() const = 0;

  // Blocking call. Coefficient rows are aligned with batch timesteps.
  virtual Prediction predict(const Batch& batch) = 0;
};

// Metadata that simply mirrors the batch; used by models that do not reorder items.
BatchMetadata metadataFromBatch(const Batch& batch);

// Check internal consistency of a table/batch (equal T and S across arrays).
// Throws std::invalid_argument with a description of the first mismatch.
void validateBatch(const Batch& batch);

// Same checks for prediction metadata (no solar-wind block).
void validateMetadata(const BatchMetadata& md);

}  // namespace dbforecast
