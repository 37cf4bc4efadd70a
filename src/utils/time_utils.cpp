#include "trustpath/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>
#include <ctime>
#include <stdexcept>

#ifdef _WIN32
#define timegm _mkgmtime
#endif

namespace trustpath {
namespace time {

uint64_t timestamp_seconds() {
    return std::chrono::duration_cast<Seconds>(Clock::now().time_since_epoch()).count();
}

std::string timestamp_to_iso8601(uint64_t timestamp_seconds) {
    auto time_t_val = static_cast<std::time_t>(timestamp_seconds);
    std::tm tm_val;

#ifdef TRUSTPATH_PLATFORM_WINDOWS
    gmtime_s(&tm_val, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_val);
#endif

    // Record timestamps carry whole seconds
    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << ".000Z";
    return oss.str();
}

uint64_t iso8601_to_timestamp(const std::string& str) {
    std::tm tm_val = {};
    std::istringstream iss(str);

    iss >> std::get_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw std::runtime_error("Failed to parse time string: " + str);
    }

    if (iss.peek() == '.') {
        iss.get();
        while (std::isdigit(iss.peek())) {
            iss.get();
        }
    }
    if (iss.get() != 'Z' || iss.peek() != std::char_traits<char>::eof()) {
        throw std::runtime_error("Time string must be UTC (trailing 'Z'): " + str);
    }

    auto time_t_val = timegm(&tm_val);
    if (time_t_val < 0) {
        throw std::runtime_error("Time before the Unix epoch: " + str);
    }
    return static_cast<uint64_t>(time_t_val);
}

} // namespace time
} // namespace trustpath
