#pragma once

#include <istream>
#include <string>

namespace dbforecast {

struct DateTime {
  int year = 0;
  int month = 0;   // 1-12
  int day = 0;     // 1-31
  int hour = 0;
  int minute = 0;
  double second = 0.0;
};

// Parse an ISO-8601 style timestamp, e.g.
//   "2015-03-17T04:00:00" or "2015-03-17 04:00:00.500"
// Returns true on success.
bool parseIsoTimestamp(const std::string& ts, DateTime& out);

// Convert calendar date/time (UTC) to Julian date.
double toJulianDateUTC(const DateTime& t);

// Inverse of toJulianDateUTC (Gregorian calendar), rounded to the millisecond.
DateTime fromJulianDateUTC(double jd);

// Julian date in whole milliseconds; used to match timesteps exactly.
long long julianMillis(double jd);

// Read the next timestamp from a whitespace-separated stream as a Julian date.
// Accepts "YYYY-MM-DDTHH:MM:SS" (one token) or "YYYY-MM-DD HH:MM:SS" (two tokens).
bool readTimestampToken(std::istream& is, double& jd);

// "YYYY-MM-DDTHH:MM:SS" (seconds truncated to whole seconds).
std::string formatIsoTimestamp(const DateTime& t);

}  // namespace dbforecast
