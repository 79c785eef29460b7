#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "pipeline_types.hpp"
#include "scaler.hpp"

namespace dbforecast {

// One ground-station measurement.
struct StationRow {
  double jd = 0.0;          // Julian date
  int station = 0;          // station slot index, 0-based
  double mlt_hours = 0.0;
  double colat_deg = 0.0;
  double dbn_nT = 0.0;
  double dbe_nT = 0.0;
};

struct SolarWindRow {
  double jd = 0.0;
  std::vector<double> values;
};

// Whitespace-separated station table:
//   <ISO timestamp> <station> <mlt_hours> <colat_deg> <dbn_nT> <dbe_nT>
// Blank lines and lines starting with '#' are skipped; malformed rows are skipped too.
// - max_rows: maximum number of data lines to load (0 => load all)
// Returns true if at least one row was read.
bool loadStationTable(const std::filesystem::path& file,
                      std::vector<StationRow>& out,
                      std::size_t max_rows = 0);

// Whitespace-separated solar-wind table: <ISO timestamp> <f0> <f1> ...
// All rows must carry the same number of features.
bool loadSolarWindTable(const std::filesystem::path& file,
                        std::vector<SolarWindRow>& out);

// Join station rows and solar-wind rows on time into a chronological table.
// Every distinct station-row time becomes one timestep; stations absent at a
// timestep stay NaN. Targets are standardized with `scalers` ("dbn", "dbe").
// Solar-wind features are taken from the matching time (NaN row if absent).
// Returns false if there are no station rows or a station index is negative.
bool buildStationTable(const std::vector<StationRow>& stations,
                       const std::vector<SolarWindRow>& solar_wind,
                       const ScalerSet& scalers,
                       StationTable& out);

}  // namespace dbforecast
