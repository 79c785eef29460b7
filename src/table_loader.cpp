#include "table_loader.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

#include "sph_basis.hpp"
#include "time_utils.hpp"

namespace dbforecast {

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

static bool isComment(const std::string& line) {
  const auto p = line.find_first_not_of(" \t\r");
  return p == std::string::npos || line[p] == '#';
}

static std::vector<double> parseDoubles(std::istringstream& iss) {
  std::vector<double> v;
  double x;
  while (iss >> x) {
    v.push_back(x);
  }
  return v;
}

bool loadStationTable(const std::filesystem::path& file,
                      std::vector<StationRow>& out,
                      std::size_t max_rows) {
  out.clear();

  std::ifstream ifs(file);
  if (!ifs.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(ifs, line)) {
    if (max_rows != 0 && out.size() >= max_rows) {
      break;
    }
    if (isComment(line)) continue;

    std::istringstream iss(line);
    StationRow row;
    if (!readTimestampToken(iss, row.jd)) continue;
    if (!(iss >> row.station >> row.mlt_hours >> row.colat_deg >> row.dbn_nT >> row.dbe_nT)) {
      continue;
    }
    out.push_back(row);
  }

  return !out.empty();
}

bool loadSolarWindTable(const std::filesystem::path& file,
                        std::vector<SolarWindRow>& out) {
  out.clear();

  std::ifstream ifs(file);
  if (!ifs.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(ifs, line)) {
    if (isComment(line)) continue;

    std::istringstream iss(line);
    SolarWindRow row;
    if (!readTimestampToken(iss, row.jd)) continue;
    row.values = parseDoubles(iss);
    if (row.values.empty()) continue;
    if (!out.empty() && row.values.size() != out.front().values.size()) {
      return false;
    }
    out.push_back(std::move(row));
  }

  return !out.empty();
}

bool buildStationTable(const std::vector<StationRow>& stations,
                       const std::vector<SolarWindRow>& solar_wind,
                       const ScalerSet& scalers,
                       StationTable& out) {
  if (stations.empty()) return false;
  if (!scalers.contains("dbn") || !scalers.contains("dbe")) return false;

  std::map<long long, double> times;
  int max_station = -1;
  for (const auto& r : stations) {
    if (r.station < 0) return false;
    times.emplace(julianMillis(r.jd), r.jd);
    max_station = std::max(max_station, r.station);
  }

  std::map<long long, Eigen::Index> row_of;
  out.times.clear();
  out.times.reserve(times.size());
  for (const auto& kv : times) {
    row_of[kv.first] = static_cast<Eigen::Index>(out.times.size());
    out.times.push_back(kv.second);
  }

  const Eigen::Index N = static_cast<Eigen::Index>(out.times.size());
  const Eigen::Index S = static_cast<Eigen::Index>(max_station) + 1;

  out.azimuth = Eigen::MatrixXd::Constant(N, S, kNaN);
  out.polar = Eigen::MatrixXd::Constant(N, S, kNaN);
  Eigen::MatrixXd dbn = Eigen::MatrixXd::Constant(N, S, kNaN);
  Eigen::MatrixXd dbe = Eigen::MatrixXd::Constant(N, S, kNaN);

  for (const auto& r : stations) {
    const Eigen::Index t = row_of[julianMillis(r.jd)];
    out.azimuth(t, r.station) = mltToAzimuth(r.mlt_hours);
    out.polar(t, r.station) = colatitudeToPolar(r.colat_deg);
    dbn(t, r.station) = r.dbn_nT;
    dbe(t, r.station) = r.dbe_nT;
  }

  out.targets.clear();
  out.targets["dbn"] = standardize(dbn, scalers.at("dbn"));
  out.targets["dbe"] = standardize(dbe, scalers.at("dbe"));

  const Eigen::Index F = solar_wind.empty() ? 0 : static_cast<Eigen::Index>(solar_wind.front().values.size());
  out.solar_wind = Eigen::MatrixXd::Constant(N, F, kNaN);
  for (const auto& r : solar_wind) {
    auto it = row_of.find(julianMillis(r.jd));
    if (it == row_of.end()) continue;
    for (Eigen::Index f = 0; f < F; ++f) {
      out.solar_wind(it->second, f) = r.values[static_cast<std::size_t>(f)];
    }
  }

  return true;
}

}  // namespace dbforecast
