#include "pcloud/types/Identifier.hpp"
#include "pcloud/errors/Errors.hpp"
#include "pcloud/types/Metadata.hpp"

#include <fmt/format.h>

#include <stdexcept>

using namespace pcloud::types;
using pcloud::errors::ConfigurationError;

void Identifier::rejectNegative(const long long id) {
    throw ConfigurationError(fmt::format("Identifier id must not be negative, got {}", id));
}

Identifier Identifier::fromMetadata(const Metadata& m, const EntityKind kind) {
    const bool folder = kind == EntityKind::Folder;
    if (m.isfolder != folder)
        throw ConfigurationError(fmt::format("'{}' is a {}, not a {}", m.name,
                                             m.isfolder ? "folder" : "file", folder ? "folder" : "file"));

    const auto& id = folder ? m.folderid : m.fileid;
    if (!id) throw ConfigurationError(fmt::format("Metadata for '{}' carries no {}", m.name, folder ? "folderid" : "fileid"));
    return *id;
}

Identifier Identifier::fromMetadata(const FileOrFolderStat& stat, const EntityKind kind) {
    if (!stat.metadata) throw ConfigurationError("Reply carries no metadata to take an id from");
    return fromMetadata(*stat.metadata, kind);
}

const std::string& Identifier::path() const {
    if (!isPath()) throw std::logic_error("Identifier does not hold a path");
    return std::get<std::string>(value_);
}

std::uint64_t Identifier::id() const {
    if (!isId()) throw std::logic_error("Identifier does not hold a numeric id");
    return std::get<std::uint64_t>(value_);
}

bool Identifier::isValid() const {
    if (isId()) return true;
    const auto& p = std::get<std::string>(value_);
    return !p.empty() && p.front() == '/';
}

QueryPair Identifier::param(const EntityKind kind) const {
    if (isPath()) return {"path", path()};
    return {kind == EntityKind::Folder ? "folderid" : "fileid", std::to_string(id())};
}

QueryPair Identifier::targetParam() const {
    if (isPath()) return {"topath", path()};
    return {"tofolderid", std::to_string(id())};
}

std::string Identifier::toString() const {
    return isPath() ? path() : "#" + std::to_string(id());
}
