#include <Eigen/Dense>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "contraction.hpp"
#include "forecast_assembler.hpp"
#include "grid_forecast.hpp"
#include "metrics.hpp"
#include "model_registry.hpp"
#include "scaler.hpp"
#include "sph_basis.hpp"
#include "table_loader.hpp"
#include "time_utils.hpp"

#ifndef DBFORECAST_DATA_DIR
#define DBFORECAST_DATA_DIR ""
#endif

namespace fs = std::filesystem;
using dbforecast::ComponentSeries;
using dbforecast::ForecastAssembler;
using dbforecast::ForecastConfig;
using dbforecast::ForecastResult;
using dbforecast::Precision;
using dbforecast::ScalerSet;
using dbforecast::StationTable;

struct Args {
  fs::path data_dir;
  std::string stations_file = "stations.txt";
  std::string solar_wind_file = "solar_wind.txt";
  std::string scaler_file = "scaler.txt";

  std::string model = "replay";
  std::string model_file = "coefficients.txt";

  int nmax = 12;
  std::size_t batch_size = 64;
  std::size_t max_stations = 0;     // 0 => number of stations in the table
  std::size_t max_rows = 0;         // 0 => load all station rows
  Precision precision = Precision::Double;

  bool write_csv = true;
  std::string csv_file = "dbforecast_results.csv";

  std::string grid_csv_file;        // empty => no grid output
  int grid_nmlt = 24;
  int grid_ncolat = 20;
  double grid_max_colat = 50.0;     // [deg]
};

static void printUsage(const char* exe) {
  std::cout
      << "Usage: " << exe << " [options]\n\n"
      << "Options:\n"
      << "  --data_dir <path>        Directory containing the input tables\n"
      << "  --stations <name>        Station table (default: stations.txt)\n"
      << "  --solar_wind <name>      Solar-wind table (default: solar_wind.txt)\n"
      << "  --scaler <name>          Scaler file, \"component mean std\" per line (default: scaler.txt)\n"
      << "  --model <name>           Inference model: replay|linear (default: replay)\n"
      << "  --model_file <name>      Model parameter file (default: coefficients.txt)\n"
      << "  --nmax <N>               Maximum harmonic degree (default: 12)\n"
      << "  --batch_size <N>         Timesteps per batch (default: 64)\n"
      << "  --max_stations <N>       Station capacity per timestep (default: from table)\n"
      << "  --max_rows <N>           Load at most N station rows (default: all)\n"
      << "  --precision <p>          Contraction precision: double|single (default: double)\n"
      << "  --no_csv                 Do not write CSV output\n"
      << "  --csv <file>             CSV output filename (default: dbforecast_results.csv)\n"
      << "  --grid_csv <file>        Also evaluate the forecast on a regular MLT/colatitude grid\n"
      << "  --grid_nmlt <N>          Grid points in MLT (default: 24)\n"
      << "  --grid_ncolat <N>        Grid points in colatitude (default: 20)\n"
      << "  --grid_max_colat <deg>   Grid colatitude extent (default: 50)\n"
      << "  -h, --help               Show this help\n";
}

static bool parseArgs(int argc, char** argv, Args& a) {
  // Default data dir from compile definition (if provided)
  if (std::string(DBFORECAST_DATA_DIR).size() > 0) {
    a.data_dir = fs::path(DBFORECAST_DATA_DIR);
  } else {
    a.data_dir = fs::current_path();
  }

  for (int i = 1; i < argc; ++i) {
    const std::string key = argv[i];
    auto needValue = [&](const std::string& k) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << k << "\n";
        return nullptr;
      }
      return argv[++i];
    };

    try {
      if (key == "-h" || key == "--help") {
        return false;
      } else if (key == "--data_dir") {
        const char* v = needValue(key);
        if (!v) return false;
        a.data_dir = fs::path(v);
      } else if (key == "--stations") {
        const char* v = needValue(key);
        if (!v) return false;
        a.stations_file = v;
      } else if (key == "--solar_wind") {
        const char* v = needValue(key);
        if (!v) return false;
        a.solar_wind_file = v;
      } else if (key == "--scaler") {
        const char* v = needValue(key);
        if (!v) return false;
        a.scaler_file = v;
      } else if (key == "--model") {
        const char* v = needValue(key);
        if (!v) return false;
        a.model = v;
      } else if (key == "--model_file") {
        const char* v = needValue(key);
        if (!v) return false;
        a.model_file = v;
      } else if (key == "--nmax") {
        const char* v = needValue(key);
        if (!v) return false;
        a.nmax = std::stoi(v);
      } else if (key == "--batch_size") {
        const char* v = needValue(key);
        if (!v) return false;
        a.batch_size = static_cast<std::size_t>(std::stoull(v));
      } else if (key == "--max_stations") {
        const char* v = needValue(key);
        if (!v) return false;
        a.max_stations = static_cast<std::size_t>(std::stoull(v));
      } else if (key == "--max_rows") {
        const char* v = needValue(key);
        if (!v) return false;
        a.max_rows = static_cast<std::size_t>(std::stoull(v));
      } else if (key == "--precision") {
        const char* v = needValue(key);
        if (!v) return false;
        a.precision = dbforecast::precisionFromString(v);
      } else if (key == "--no_csv") {
        a.write_csv = false;
      } else if (key == "--csv") {
        const char* v = needValue(key);
        if (!v) return false;
        a.csv_file = v;
        a.write_csv = true;
      } else if (key == "--grid_csv") {
        const char* v = needValue(key);
        if (!v) return false;
        a.grid_csv_file = v;
      } else if (key == "--grid_nmlt") {
        const char* v = needValue(key);
        if (!v) return false;
        a.grid_nmlt = std::stoi(v);
      } else if (key == "--grid_ncolat") {
        const char* v = needValue(key);
        if (!v) return false;
        a.grid_ncolat = std::stoi(v);
      } else if (key == "--grid_max_colat") {
        const char* v = needValue(key);
        if (!v) return false;
        a.grid_max_colat = std::stod(v);
      } else {
        std::cerr << "Unknown option: " << key << "\n";
        return false;
      }
    } catch (const std::exception& e) {
      std::cerr << "Invalid value for " << key << ": " << e.what() << "\n";
      return false;
    }
  }

  return true;
}

static fs::path resolve(const fs::path& dir, const std::string& name) {
  const fs::path p(name);
  return p.is_absolute() ? p : dir / p;
}

static void writeSeriesCsv(std::ofstream& csv, const ForecastResult& result) {
  csv << "k,time,component,station,mlt_h,colat_deg,forecast_nT,target_nT\n";
  for (const auto& kv : result) {
    const ComponentSeries& s = kv.second;
    for (std::size_t k = 0; k < s.steps(); ++k) {
      const Eigen::Index r = static_cast<Eigen::Index>(k);
      const std::string ts = dbforecast::formatIsoTimestamp(dbforecast::fromJulianDateUTC(s.times[k]));
      for (Eigen::Index j = 0; j < s.predictions.cols(); ++j) {
        if (std::isnan(s.azimuth(r, j))) continue;
        csv << k << "," << ts << "," << kv.first << "," << j << ","
            << dbforecast::azimuthToMlt(s.azimuth(r, j)) << ","
            << dbforecast::polarToColatitude(s.polar(r, j)) << ","
            << s.predictions(r, j) << "," << s.targets(r, j) << "\n";
      }
    }
  }
}

static bool writeGridCsv(const std::string& file, const Args& args,
                         const ForecastResult& result, const ScalerSet& scalers) {
  std::ofstream csv(file);
  if (!csv.is_open()) return false;

  const dbforecast::Grid grid = dbforecast::regularGrid(args.grid_nmlt, args.grid_ncolat, args.grid_max_colat);
  const dbforecast::GridForecaster gf(args.nmax, grid, args.precision);

  const ComponentSeries& dbn = result.at("dbn");
  const ComponentSeries& dbe = result.at("dbe");

  csv << "k,time,mlt_h,colat_deg,dbn_nT,dbe_nT,dbh_nT\n";
  for (std::size_t k = 0; k < dbn.steps(); ++k) {
    const Eigen::Index r = static_cast<Eigen::Index>(k);
    const Eigen::MatrixXd n = gf.evaluate(dbn.coefficients.row(r), scalers.at("dbn"));
    const Eigen::MatrixXd e = gf.evaluate(dbe.coefficients.row(r), scalers.at("dbe"));
    const Eigen::MatrixXd h = dbforecast::horizontalMagnitude(n, e);
    const std::string ts = dbforecast::formatIsoTimestamp(dbforecast::fromJulianDateUTC(dbn.times[k]));
    for (Eigen::Index j = 0; j < n.cols(); ++j) {
      for (Eigen::Index i = 0; i < n.rows(); ++i) {
        csv << k << "," << ts << ","
            << dbforecast::azimuthToMlt(grid.azimuth(i, j)) << ","
            << dbforecast::polarToColatitude(grid.polar(i, j)) << ","
            << n(i, j) << "," << e(i, j) << "," << h(i, j) << "\n";
      }
    }
  }
  return true;
}

int main(int argc, char** argv) {
  Args args;
  if (!parseArgs(argc, argv, args)) {
    printUsage(argv[0]);
    return (argc > 1) ? 1 : 0;
  }

  ScalerSet scalers;
  const fs::path scaler_path = resolve(args.data_dir, args.scaler_file);
  if (!scalers.load(scaler_path.string())) {
    std::cerr << "Failed to load scaler file: " << scaler_path << "\n";
    return 2;
  }

  const fs::path stations_path = resolve(args.data_dir, args.stations_file);
  std::vector<dbforecast::StationRow> station_rows;
  if (!dbforecast::loadStationTable(stations_path, station_rows, args.max_rows)) {
    std::cerr << "Failed to load station table: " << stations_path << "\n";
    std::cerr << "Tip: pass --data_dir /path/to/tables\n";
    return 3;
  }

  // Solar-wind features are only needed by models that read them.
  const fs::path sw_path = resolve(args.data_dir, args.solar_wind_file);
  std::vector<dbforecast::SolarWindRow> sw_rows;
  if (!dbforecast::loadSolarWindTable(sw_path, sw_rows)) {
    std::cerr << "Warning: no solar-wind table loaded from " << sw_path << "\n";
  }

  StationTable table;
  if (!dbforecast::buildStationTable(station_rows, sw_rows, scalers, table)) {
    std::cerr << "Failed to assemble station table (need dbn/dbe scalers and non-negative station indices)\n";
    return 4;
  }

  std::cout << "Loaded " << station_rows.size() << " station rows, "
            << table.times.size() << " timesteps, "
            << table.azimuth.cols() << " stations from: " << stations_path << "\n";

  try {
    dbforecast::ModelOptions mopts;
    mopts.file = resolve(args.data_dir, args.model_file);
    mopts.nmax = args.nmax;

    const dbforecast::ModelRegistry registry = dbforecast::ModelRegistry::withBuiltins();
    std::unique_ptr<dbforecast::InferenceModel> model = registry.create(args.model, mopts);

    ForecastConfig cfg;
    cfg.nmax = args.nmax;
    cfg.max_stations = (args.max_stations > 0) ? args.max_stations
                                               : static_cast<std::size_t>(table.azimuth.cols());
    cfg.precision = args.precision;

    std::cout << "Model: " << model->name() << ", nmax=" << cfg.nmax
              << " (" << dbforecast::basisSize(cfg.nmax) << " basis functions)"
              << ", precision=" << dbforecast::precisionToString(cfg.precision)
              << ", batch_size=" << args.batch_size << "\n";

    dbforecast::TableDataSource source(std::move(table), args.batch_size);
    const ForecastAssembler assembler(cfg, scalers);
    const ForecastResult result = assembler.run(source, *model);

    if (args.write_csv) {
      std::ofstream csv(args.csv_file);
      if (!csv.is_open()) {
        std::cerr << "Warning: could not open CSV file for writing: " << args.csv_file << "\n";
      } else {
        writeSeriesCsv(csv, result);
        std::cout << "Wrote CSV: " << args.csv_file << "\n";
      }
    }

    if (!args.grid_csv_file.empty()) {
      if (!writeGridCsv(args.grid_csv_file, args, result, scalers)) {
        std::cerr << "Warning: could not open grid CSV file for writing: " << args.grid_csv_file << "\n";
      } else {
        std::cout << "Wrote grid CSV: " << args.grid_csv_file << "\n";
      }
    }

    std::cout << "\n==== Forecast summary ====\n";
    std::cout << "Batches: " << source.batchCount() << ", timesteps: " << result.at("dbn").steps() << "\n";
    for (const auto& kv : result) {
      const ComponentSeries& s = kv.second;
      std::cout << kv.first << ": MAE " << dbforecast::meanAbsoluteError(s.predictions, s.targets)
                << " nT, RMSE " << dbforecast::rootMeanSquaredError(s.predictions, s.targets)
                << " nT (" << dbforecast::validCount(s.predictions, s.targets) << " samples)\n";
    }
    const Eigen::MatrixXd dbh_pred = dbforecast::horizontalMagnitude(result.at("dbn").predictions,
                                                                     result.at("dbe").predictions);
    const Eigen::MatrixXd dbh_true = dbforecast::horizontalMagnitude(result.at("dbn").targets,
                                                                     result.at("dbe").targets);
    std::cout << "dbh: MAE " << dbforecast::meanAbsoluteError(dbh_pred, dbh_true)
              << " nT, RMSE " << dbforecast::rootMeanSquaredError(dbh_pred, dbh_true) << " nT\n";
    std::cout << "==========================\n";
  } catch (const std::exception& e) {
    std::cerr << "Forecast failed: " << e.what() << "\n";
    return 5;
  }

  return 0;
}
