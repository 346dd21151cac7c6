#pragma once

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pcloud::http {

struct Response {
    long status = 0;
    std::string body;
    std::string headers;   // raw header block as received

    [[nodiscard]] bool ok() const { return status / 100 == 2; }

    [[nodiscard]] const std::string& text() const { return body; }
    [[nodiscard]] std::vector<unsigned char> bytes() const;

    // Throws errors::ServerError if the body is not JSON.
    [[nodiscard]] nlohmann::json json() const;

    // Case-insensitive lookup in the last header block.
    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
};

}
