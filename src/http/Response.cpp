#include "pcloud/http/Response.hpp"
#include "pcloud/errors/Errors.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <sstream>

using namespace pcloud::http;
using namespace pcloud::errors;

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

}

std::vector<unsigned char> Response::bytes() const {
    return {body.begin(), body.end()};
}

nlohmann::json Response::json() const {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        if (!ok()) throw ServerError(static_cast<int>(status), fmt::format("HTTP {}", status));
        throw ServerError(static_cast<int>(status), "Response body is not valid JSON");
    }
    return parsed;
}

std::optional<std::string> Response::header(const std::string& name) const {
    const auto wanted = lower(name);
    std::optional<std::string> found;
    std::istringstream in(headers);
    std::string line;
    while (std::getline(in, line)) {
        // redirects produce several blocks; a status line starts a new one
        if (line.rfind("HTTP/", 0) == 0) { found.reset(); continue; }
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (lower(trim(line.substr(0, colon))) == wanted) found = trim(line.substr(colon + 1));
    }
    return found;
}
