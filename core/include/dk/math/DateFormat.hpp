#pragma once
#include "dk/core/Status.hpp"

#include <ctime>
#include <string>

namespace dk {

struct CalendarDate {
  int year{1970};
  int month{1};  // 1-12
  int day{1};    // 1-31
};

// Cross-platform timegm (struct tm -> epoch seconds as UTC).
inline std::time_t portableTimegm(std::tm* tm) {
#ifdef _WIN32
  return _mkgmtime(tm);
#else
  return timegm(tm);
#endif
}

// Strict "YYYY-MM-DD", including the day-of-month range.
Status parseIsoDate(const std::string& text, CalendarDate& out);

// Today in local time.
CalendarDate todayLocal();

// strftime over the date (time fields zero). An empty pattern yields the
// day of month without a leading zero.
std::string formatDate(const CalendarDate& date, const std::string& pattern);

} // namespace dk
