#include "hfpull/formatting.hpp"
#include <array>
#include <iomanip>
#include <sstream>

namespace hfpull {

std::string formatSize(double bytes) {
  static const std::array<const char *, 5> units = {"B", "KB", "MB", "GB",
                                                    "TB"};
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2);
  for (const char *unit : units) {
    if (bytes < 1024.0) {
      ss << bytes << " " << unit;
      return ss.str();
    }
    bytes /= 1024.0;
  }
  ss << bytes << " PB";
  return ss.str();
}

std::string formatSpeed(double bytesPerSecond) {
  return formatSize(bytesPerSecond) + "/s";
}

std::string formatProgress(std::uint64_t downloaded, std::uint64_t total,
                           double speed, double percentage) {
  std::ostringstream ss;
  ss << formatSize(static_cast<double>(downloaded));
  if (total > 0) {
    ss << " / " << formatSize(static_cast<double>(total));
  }
  if (speed > 0) {
    ss << " | " << formatSpeed(speed);
  }
  if (total > 0) {
    ss << " | " << std::fixed << std::setprecision(1) << percentage << "%";
  }
  return ss.str();
}

} // namespace hfpull
