#include "pcloud/http/Payload.hpp"
#include "pcloud/errors/Errors.hpp"

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <sstream>

using namespace pcloud::http;
using namespace pcloud::errors;

Payload Payload::fromBytes(std::string bytes) {
    return {std::move(bytes)};
}

Payload Payload::fromFile(std::filesystem::path path) {
    if (!std::filesystem::is_regular_file(path))
        throw ConfigurationError(fmt::format("Upload source is not a regular file: {}", path.string()));
    Payload p;
    p.source_ = std::move(path);
    return p;
}

Payload Payload::fromStream(std::shared_ptr<std::istream> stream, const std::optional<std::uint64_t> size) {
    if (!stream) throw ConfigurationError("Upload stream must not be null");
    Payload p;
    p.source_ = std::move(stream);
    p.streamSize_ = size;
    return p;
}

std::optional<std::uint64_t> Payload::size() const {
    if (isBytes()) return bytes().size();
    if (isFile()) return std::filesystem::file_size(file());
    return streamSize_;
}

std::string Payload::readAll() const {
    if (isBytes()) return bytes();

    if (isFile()) {
        std::ifstream in(file(), std::ios::binary);
        if (!in) throw TransportError(fmt::format("Failed to open upload source {}", file().string()));
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    std::ostringstream out;
    out << stream()->rdbuf();
    return out.str();
}
