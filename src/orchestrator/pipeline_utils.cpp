// EN: Pipeline Utils implementation
// FR: Implémentation Pipeline Utils

#include "orchestrator/pipeline_utils.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <sys/resource.h>
#include <unistd.h>

namespace PSB {
namespace Orchestrator {

std::string PipelineUtils::formatSeconds(std::chrono::steady_clock::duration duration) {
    const double seconds = std::chrono::duration<double>(duration).count();
    std::ostringstream oss;
    oss << std::round(seconds * 100.0) / 100.0;
    return oss.str();
}

std::string PipelineUtils::formatBytes(std::int64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    const bool negative = bytes < 0;
    double value = std::fabs(static_cast<double>(bytes));
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    if (negative) {
        oss << "-";
    }
    oss << std::round(value * 100.0) / 100.0 << " " << units[unit];
    return oss.str();
}

std::string PipelineUtils::trim(const std::string& value, const std::string& characters) {
    const auto begin = value.find_first_not_of(characters);
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(characters);
    return value.substr(begin, end - begin + 1);
}

bool PipelineUtils::isProductionBaseUrl(const std::string& baseurl) {
    return !trim(baseurl, " \t\r\n\v\f/").empty();
}

// EN: Read resident pages from /proc/self/statm, fall back to getrusage peak RSS.
// FR: Lit les pages résidentes dans /proc/self/statm, repli sur le pic RSS de getrusage.
std::int64_t PipelineUtils::currentMemoryUsage() {
    std::ifstream statm("/proc/self/statm");
    long total_pages = 0;
    long resident_pages = 0;
    if (statm >> total_pages >> resident_pages) {
        const long page_size = sysconf(_SC_PAGESIZE);
        if (page_size > 0) {
            return static_cast<std::int64_t>(resident_pages) * page_size;
        }
    }

    struct rusage usage{};
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        return static_cast<std::int64_t>(usage.ru_maxrss) * 1024;
    }
    return 0;
}

} // namespace Orchestrator
} // namespace PSB
