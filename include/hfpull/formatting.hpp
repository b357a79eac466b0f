#ifndef HFPULL_FORMATTING_HPP
#define HFPULL_FORMATTING_HPP

#include <cstdint>
#include <string>

namespace hfpull {

// 1024-based units with two decimals: "0.00 B", "1.50 KB", "3.25 GB".
std::string formatSize(double bytes);

// formatSize(bytesPerSecond) + "/s"
std::string formatSpeed(double bytesPerSecond);

// One progress line, e.g. "1.00 MB / 4.00 MB | 512.00 KB/s | 25.0%".
// When total is 0 the total and percentage are left out; a zero speed is
// left out as well.
std::string formatProgress(std::uint64_t downloaded, std::uint64_t total,
                           double speed, double percentage);

} // namespace hfpull

#endif // HFPULL_FORMATTING_HPP
