#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace pcloud::http {

// Body of one uploaded file: bytes held in memory, a file on disk, or a caller-owned stream.
class Payload {
public:
    Payload() = default;
    Payload(std::string bytes) : source_(std::move(bytes)) {}
    Payload(const char* bytes) : source_(std::string(bytes)) {}

    static Payload fromBytes(std::string bytes);
    static Payload fromFile(std::filesystem::path path);
    static Payload fromStream(std::shared_ptr<std::istream> stream, std::optional<std::uint64_t> size = std::nullopt);

    [[nodiscard]] bool isBytes() const { return std::holds_alternative<std::string>(source_); }
    [[nodiscard]] bool isFile() const { return std::holds_alternative<std::filesystem::path>(source_); }
    [[nodiscard]] bool isStream() const { return std::holds_alternative<std::shared_ptr<std::istream>>(source_); }

    [[nodiscard]] const std::string& bytes() const { return std::get<std::string>(source_); }
    [[nodiscard]] const std::filesystem::path& file() const { return std::get<std::filesystem::path>(source_); }
    [[nodiscard]] const std::shared_ptr<std::istream>& stream() const { return std::get<std::shared_ptr<std::istream>>(source_); }

    // Known length in bytes, if any.
    [[nodiscard]] std::optional<std::uint64_t> size() const;

    // Materializes the whole body. Consumes a stream payload.
    [[nodiscard]] std::string readAll() const;

private:
    std::variant<std::string, std::filesystem::path, std::shared_ptr<std::istream>> source_;
    std::optional<std::uint64_t> streamSize_;
};

}
