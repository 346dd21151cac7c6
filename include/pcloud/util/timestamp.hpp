#pragma once

#include <ctime>
#include <string>

namespace pcloud::util {

// pCloud renders dates as "Thu, 21 Mar 2024 14:05:09 +0000".
inline constexpr const char* PCLOUD_DATE_FORMAT = "%a, %d %b %Y %H:%M:%S";

// Throws std::invalid_argument for anything that is not a pCloud date.
std::time_t parsePCloudTimestamp(const std::string& str);

std::string formatPCloudTimestamp(std::time_t ts);

}
