/* @file Session.cpp
 * @brief timestamp formatting for logs and archives
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <iomanip>
#include <sstream>

// HVLoad headers
#include "core/Session.hpp"

namespace hvload::core {

  namespace {
    std::tm localTime(WallClock::time_point t) {
      const std::time_t tt = WallClock::to_time_t(t);
      std::tm tm{};
      ::localtime_r(&tt, &tm);
      return tm;
    }
  } // namespace

  std::string formatIso8601(WallClock::time_point t) {
    const std::tm tm = localTime(t);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()) % 1000;

    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << ms.count();
    return os.str();
  }

  std::string formatCompact(WallClock::time_point t) {
    const std::tm tm = localTime(t);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return os.str();
  }

} // namespace hvload::core
