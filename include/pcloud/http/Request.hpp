#pragma once

#include "pcloud/http/Payload.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pcloud::http {

enum class Method { Get, Post };

using Param = std::pair<std::string, std::string>;

struct FilePart {
    std::string filename;
    Payload payload;
};

struct Request {
    Method method = Method::Get;
    std::string url;
    std::vector<Param> query;
    std::vector<Param> form;
    std::vector<std::string> headers;   // "Name: value"
    std::vector<FilePart> files;         // non-empty means multipart/form-data
    std::optional<std::chrono::milliseconds> timeout;

    Request& param(std::string name, std::string value);
    Request& param(const std::pair<std::string, std::string>& p) { return param(p.first, p.second); }
    Request& field(std::string name, std::string value);
    Request& header(std::string line);

    // First query or form value with the given name.
    [[nodiscard]] std::optional<std::string> find(const std::string& name) const;
    [[nodiscard]] bool has(const std::string& name) const { return find(name).has_value(); }

    // Last path segment of the url, i.e. the pCloud method name.
    [[nodiscard]] std::string apiMethod() const;
};

}
