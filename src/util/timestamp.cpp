#include "pcloud/util/timestamp.hpp"

#include <cctype>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace pcloud::util {

std::time_t parsePCloudTimestamp(const std::string& str) {
    std::tm tm = {};
    std::istringstream ss(str);
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm, PCLOUD_DATE_FORMAT);
    if (ss.fail()) throw std::invalid_argument("Failed to parse pCloud timestamp: " + str);

    // trailing numeric zone, e.g. "+0000" or "-0130"
    std::string zone;
    ss >> zone;
    long offset = 0;
    if (!zone.empty()) {
        if (zone.size() != 5 || (zone[0] != '+' && zone[0] != '-') ||
            !std::isdigit(static_cast<unsigned char>(zone[1])) || !std::isdigit(static_cast<unsigned char>(zone[2])) ||
            !std::isdigit(static_cast<unsigned char>(zone[3])) || !std::isdigit(static_cast<unsigned char>(zone[4])))
            throw std::invalid_argument("Failed to parse pCloud timestamp zone: " + str);

        const long hours = std::stol(zone.substr(1, 2));
        const long minutes = std::stol(zone.substr(3, 2));
        offset = (hours * 3600 + minutes * 60) * (zone[0] == '-' ? -1 : 1);
    }

    return timegm(&tm) - offset;
}

std::string formatPCloudTimestamp(const std::time_t ts) {
    std::tm tm = {};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, PCLOUD_DATE_FORMAT) << " +0000";
    return oss.str();
}

}
