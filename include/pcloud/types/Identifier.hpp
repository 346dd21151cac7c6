#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace pcloud::types {

enum class EntityKind { Folder, File };

using QueryPair = std::pair<std::string, std::string>;

struct Metadata;
struct FileOrFolderStat;

/**
 * Addresses a folder or file on the remote side, either by absolute path or by
 * numeric id. Exactly one representation is carried; "/" stays a path and is
 * never rewritten to folder id 0.
 */
class Identifier {
public:
    Identifier(std::string path) : value_(std::move(path)) {}
    Identifier(const char* path) : value_(std::string(path)) {}

    // Negative ids throw errors::ConfigurationError.
    template<std::integral T> requires (!std::same_as<T, bool>)
    Identifier(T id) : value_(checkedId(id)) {}

    // The folderid or fileid of a reply entry. Throws errors::ConfigurationError
    // when the entry is of the other kind or carries no id.
    static Identifier fromMetadata(const Metadata& m, EntityKind kind);
    static Identifier fromMetadata(const FileOrFolderStat& stat, EntityKind kind);

    [[nodiscard]] bool isPath() const { return std::holds_alternative<std::string>(value_); }
    [[nodiscard]] bool isId() const { return std::holds_alternative<std::uint64_t>(value_); }

    [[nodiscard]] const std::string& path() const;
    [[nodiscard]] std::uint64_t id() const;

    // Ids are always valid; paths must be absolute.
    [[nodiscard]] bool isValid() const;

    // ("path", p) for paths, ("folderid"|"fileid", id) for ids.
    [[nodiscard]] QueryPair param(EntityKind kind) const;

    // Destination of a copy/move: ("topath", p) or ("tofolderid", id).
    [[nodiscard]] QueryPair targetParam() const;

    [[nodiscard]] std::string toString() const;

    bool operator==(const Identifier&) const = default;

private:
    template<std::integral T>
    static std::uint64_t checkedId(const T id) {
        if constexpr (std::is_signed_v<T>)
            if (id < 0) rejectNegative(static_cast<long long>(id));
        return static_cast<std::uint64_t>(id);
    }

    [[noreturn]] static void rejectNegative(long long id);

    std::variant<std::string, std::uint64_t> value_;
};

}
