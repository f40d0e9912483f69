// Hash-based identifiers and calendar conversions.

#include "core/EntityIds.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>
#include <stdexcept>

static std::string to_hex(const uint8_t *p, size_t n) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < n; ++i)
    oss << std::setw(2) << (int)p[i];
  return oss.str();
}

std::string EntityIds::sha256_hex(const std::string &material) {
  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
  SHA256(reinterpret_cast<const unsigned char *>(material.data()),
         material.size(), digest.data());
  return to_hex(digest.data(), digest.size());
}

std::string EntityIds::cluster_id(const std::string &shift_id,
                                  EpochMs started_at) {
  return sha256_hex("v1|cluster|" + shift_id + "|" +
                    std::to_string(started_at));
}

std::string EntityIds::trip_id(const std::string &shift_id, EpochMs started_at,
                               EpochMs ended_at) {
  return sha256_hex("v1|trip|" + shift_id + "|" + std::to_string(started_at) +
                    "|" + std::to_string(ended_at));
}

std::string EntityIds::carpool_group_id(const std::string &trip_date,
                                        std::vector<std::string> trip_ids) {
  std::sort(trip_ids.begin(), trip_ids.end());
  std::string material = "v1|carpool|" + trip_date + "|";
  for (size_t i = 0; i < trip_ids.size(); ++i) {
    if (i)
      material.push_back(';');
    material += trip_ids[i];
  }
  return sha256_hex(material);
}

std::string EntityIds::ignored_suggestion_id(const Coordinate &centroid,
                                             EpochMs ignored_at) {
  char coords[64];
  std::snprintf(coords, sizeof(coords), "%.7f|%.7f", centroid.lat,
                centroid.lon);
  return sha256_hex(std::string("v1|ignore|") + coords + "|" +
                    std::to_string(ignored_at));
}

// days_from_civil / civil_from_days (H. Hinnant's algorithms)
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static void civil_from_days(int64_t z, int64_t &y, unsigned &m, unsigned &d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y += (m <= 2);
}

EpochMs EntityIds::day_start_ms(const std::string &yyyy_mm_dd) {
  int y = 0;
  unsigned m = 0, d = 0;
  if (yyyy_mm_dd.size() != 10 ||
      std::sscanf(yyyy_mm_dd.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3 ||
      m < 1 || m > 12 || d < 1 || d > 31)
    throw std::invalid_argument("invalid date (expected YYYY-MM-DD): " +
                                yyyy_mm_dd);
  return days_from_civil(y, m, d) * kMsPerDay;
}

std::string EntityIds::format_day(EpochMs t) {
  int64_t days = t / kMsPerDay;
  if (t % kMsPerDay < 0)
    --days;
  int64_t y = 0;
  unsigned m = 0, d = 0;
  civil_from_days(days, y, m, d);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u",
                static_cast<long long>(y), m, d);
  return buf;
}
