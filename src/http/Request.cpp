#include "pcloud/http/Request.hpp"

using namespace pcloud::http;

Request& Request::param(std::string name, std::string value) {
    query.emplace_back(std::move(name), std::move(value));
    return *this;
}

Request& Request::field(std::string name, std::string value) {
    form.emplace_back(std::move(name), std::move(value));
    return *this;
}

Request& Request::header(std::string line) {
    headers.push_back(std::move(line));
    return *this;
}

std::optional<std::string> Request::find(const std::string& name) const {
    for (const auto& [k, v] : query) if (k == name) return v;
    for (const auto& [k, v] : form) if (k == name) return v;
    return std::nullopt;
}

std::string Request::apiMethod() const {
    auto end = url.find('?');
    if (end == std::string::npos) end = url.size();
    const auto slash = url.rfind('/', end == 0 ? 0 : end - 1);
    if (slash == std::string::npos) return url.substr(0, end);
    return url.substr(slash + 1, end - slash - 1);
}
