#include "time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <regex>

namespace dbforecast {

static std::string trim(const std::string& s) {
  auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return std::string();
  return std::string(b, e);
}

static bool isLeapYear(int y) {
  return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

static int daysInMonth(int y, int m) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && isLeapYear(y)) ? 29 : kDays[m - 1];
}

bool parseIsoTimestamp(const std::string& ts, DateTime& out) {
  const std::string s = trim(ts);

  static const std::regex re(
      R"(^(\d{4})-(\d{2})-(\d{2})[T ](\d{1,2}):(\d{2}):(\d{2}(?:\.\d+)?)Z?$)");

  std::smatch m;
  if (!std::regex_match(s, m, re)) {
    return false;
  }

  const int year = std::stoi(m[1].str());
  const int month = std::stoi(m[2].str());
  const int day = std::stoi(m[3].str());
  const int hour = std::stoi(m[4].str());
  const int minute = std::stoi(m[5].str());
  const double second = std::stod(m[6].str());

  if (month < 1 || month > 12) return false;
  if (day < 1 || day > daysInMonth(year, month)) return false;
  if (hour > 23 || minute > 59 || second >= 61.0) return false;

  out.year = year;
  out.month = month;
  out.day = day;
  out.hour = hour;
  out.minute = minute;
  out.second = second;
  return true;
}

// Gregorian calendar to Julian date (UTC).
double toJulianDateUTC(const DateTime& t) {
  int Y = t.year;
  int M = t.month;
  const int D = t.day;

  if (M <= 2) {
    Y -= 1;
    M += 12;
  }

  const int A = static_cast<int>(std::floor(Y / 100.0));
  const int B = 2 - A + static_cast<int>(std::floor(A / 4.0));

  const double day_fraction = (t.hour + (t.minute + t.second / 60.0) / 60.0) / 24.0;

  const double JD = std::floor(365.25 * (Y + 4716)) + std::floor(30.6001 * (M + 1)) + D + B - 1524.5 + day_fraction;
  return JD;
}

// Meeus, Astronomical Algorithms, ch. 7.
DateTime fromJulianDateUTC(double jd) {
  // Work in whole milliseconds of the civil day to avoid 59.9999 s artefacts.
  const double jd_shift = jd + 0.5;
  double Z = std::floor(jd_shift);
  double ms = std::round((jd_shift - Z) * 86400000.0);
  if (ms >= 86400000.0) {
    ms -= 86400000.0;
    Z += 1.0;
  }

  double A = Z;
  if (Z >= 2299161.0) {
    const double alpha = std::floor((Z - 1867216.25) / 36524.25);
    A = Z + 1.0 + alpha - std::floor(alpha / 4.0);
  }
  const double B = A + 1524.0;
  const double C = std::floor((B - 122.1) / 365.25);
  const double D = std::floor(365.25 * C);
  const double E = std::floor((B - D) / 30.6001);

  DateTime t;
  t.day = static_cast<int>(B - D - std::floor(30.6001 * E));
  t.month = static_cast<int>(E < 14.0 ? E - 1.0 : E - 13.0);
  t.year = static_cast<int>(t.month > 2 ? C - 4716.0 : C - 4715.0);

  const long long total_ms = static_cast<long long>(ms);
  t.hour = static_cast<int>(total_ms / 3600000LL);
  t.minute = static_cast<int>((total_ms / 60000LL) % 60LL);
  t.second = static_cast<double>(total_ms % 60000LL) / 1000.0;
  return t;
}

long long julianMillis(double jd) {
  return static_cast<long long>(std::llround(jd * 86400000.0));
}

bool readTimestampToken(std::istream& is, double& jd) {
  std::string first;
  if (!(is >> first)) return false;

  DateTime dt;
  if (first.find('T') != std::string::npos) {
    if (!parseIsoTimestamp(first, dt)) return false;
  } else {
    std::string second;
    if (!(is >> second)) return false;
    if (!parseIsoTimestamp(first + " " + second, dt)) return false;
  }
  jd = toJulianDateUTC(dt);
  return true;
}

std::string formatIsoTimestamp(const DateTime& t) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                t.year, t.month, t.day, t.hour, t.minute,
                static_cast<int>(std::floor(t.second)));
  return std::string(buf);
}

}  // namespace dbforecast
