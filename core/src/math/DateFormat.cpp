#include "dk/math/DateFormat.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace dk {

namespace {

bool isLeap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int daysInMonth(int y, int m) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && isLeap(y)) ? 29 : kDays[m - 1];
}

bool digits(const std::string& s, std::size_t pos, std::size_t n, int& out) {
  int v = 0;
  for (std::size_t i = pos; i < pos + n; i++) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    v = v * 10 + (s[i] - '0');
  }
  out = v;
  return true;
}

} // anonymous namespace

Status parseIsoDate(const std::string& text, CalendarDate& out) {
  CalendarDate d;
  bool ok = text.size() == 10 && text[4] == '-' && text[7] == '-' &&
            digits(text, 0, 4, d.year) && digits(text, 5, 2, d.month) &&
            digits(text, 8, 2, d.day);
  if (ok) ok = d.month >= 1 && d.month <= 12 && d.day >= 1 &&
               d.day <= daysInMonth(d.year, d.month);
  if (!ok) {
    return configError("BAD_DATE", "Invalid date '" + text + "' (expected YYYY-MM-DD)",
                       "{\"date\":" + jsonQuote(text) + "}");
  }
  out = d;
  return {};
}

CalendarDate todayLocal() {
  std::time_t now = std::time(nullptr);
  std::tm tm;
#ifdef _WIN32
  localtime_s(&tm, &now);
#else
  localtime_r(&now, &tm);
#endif
  return {tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::string formatDate(const CalendarDate& date, const std::string& pattern) {
  if (pattern.empty()) return std::to_string(date.day);

  std::tm tm{};
  tm.tm_year = date.year - 1900;
  tm.tm_mon = date.month - 1;
  tm.tm_mday = date.day;
  std::time_t epoch = portableTimegm(&tm);
  std::tm full;
#ifdef _WIN32
  gmtime_s(&full, &epoch);
#else
  gmtime_r(&epoch, &full);
#endif
  // strftime returns 0 when the buffer is too small; grow until it fits.
  // A pattern that legitimately expands to nothing stops at the cap.
  const std::size_t cap = 64 * pattern.size() + 1024;
  std::vector<char> buf(128 + pattern.size());
  for (;;) {
    std::size_t n = std::strftime(buf.data(), buf.size(), pattern.c_str(), &full);
    if (n > 0 || buf.size() >= cap) return std::string(buf.data(), n);
    buf.resize(std::min(buf.size() * 2, cap));
  }
}

} // namespace dk
