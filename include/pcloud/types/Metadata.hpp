#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pcloud::types {

enum class FileCategory : std::uint8_t {
    Uncategorized = 0,
    Image = 1,
    Video = 2,
    Audio = 3,
    Document = 4,
    Archive = 5,
};

// Metadata object attached to almost every file or folder reply.
struct Metadata {
    std::uint64_t parentfolderid{};
    bool isfolder = false;
    bool ismine = true;
    bool isshared = false;
    bool thumb = false;
    std::string name;
    std::string id;   // "d<folderid>" or "f<fileid>"
    std::optional<std::uint64_t> folderid, fileid, userid, size, hash;
    std::optional<bool> canread, canmodify, candelete, cancreate, isdeleted;
    std::optional<std::string> path, icon, contenttype;
    std::optional<FileCategory> category;
    std::time_t created{};
    std::time_t modified{};
    std::vector<Metadata> contents;

    [[nodiscard]] const Metadata* child(const std::string& childName) const;
};

struct FileOrFolderStat {
    std::optional<Metadata> metadata;
};

struct FolderDeleted {
    std::uint64_t deletedfiles{};
    std::uint64_t deletedfolders{};
};

struct FileChecksums {
    std::optional<Metadata> metadata;
    std::optional<std::string> sha1, md5, sha256;

    // Only the algorithms present in the reply, lowercase names.
    [[nodiscard]] std::map<std::string, std::string> toChecksumSet() const;
};

struct UserInfo {
    std::optional<std::string> auth;
    std::optional<std::uint64_t> userid, usedquota, quota;
    std::optional<std::string> email, language;
    std::optional<bool> emailverified, premium;
    std::optional<std::time_t> registered;
};

struct DownloadLink {
    std::optional<std::string> path;
    std::optional<std::time_t> expires;
    std::vector<std::string> hosts;

    // https://<first host><path>
    [[nodiscard]] std::string url() const;
};

struct PublicFileLink {
    std::optional<std::uint64_t> linkid, downloads;
    std::optional<std::string> code, link, shortcode, shortlink;
    std::optional<Metadata> metadata;
    std::optional<std::time_t> created, modified;
    std::optional<bool> downloadenabled;
};

struct Revision {
    std::uint64_t revisionid{};
    std::uint64_t size{};
    std::optional<std::uint64_t> hash;
    std::time_t created{};
};

struct RevisionList {
    std::optional<Metadata> metadata;
    std::vector<Revision> revisions;
};

enum class DiffEvent {
    Reset,
    CreateFolder,
    DeleteFolder,
    ModifyFolder,
    CreateFile,
    ModifyFile,
    DeleteFile,
    RequestShareIn,
    AcceptedShareIn,
    DeclinedShareIn,
    DeclinedShareOut,
    CancelledShareIn,
    RemovedShareIn,
    ModifiedShareIn,
    ModifyUserInfo,
    Unknown,
};

DiffEvent diffEventFromString(const std::string& s);

struct DiffEntry {
    std::time_t time{};
    std::uint64_t diffid{};
    DiffEvent event = DiffEvent::Unknown;
    std::optional<Metadata> metadata;
};

struct Diff {
    std::uint64_t diffid{};
    std::vector<DiffEntry> entries;
};

struct ApiServers {
    std::vector<std::string> api, binapi;
};

void from_json(const nlohmann::json& j, Metadata& m);
void to_json(nlohmann::json& j, const Metadata& m);
void from_json(const nlohmann::json& j, FileOrFolderStat& s);
void from_json(const nlohmann::json& j, FolderDeleted& d);
void from_json(const nlohmann::json& j, FileChecksums& c);
void from_json(const nlohmann::json& j, UserInfo& u);
void from_json(const nlohmann::json& j, DownloadLink& l);
void from_json(const nlohmann::json& j, PublicFileLink& l);
void from_json(const nlohmann::json& j, Revision& r);
void from_json(const nlohmann::json& j, RevisionList& r);
void from_json(const nlohmann::json& j, DiffEntry& e);
void from_json(const nlohmann::json& j, Diff& d);
void from_json(const nlohmann::json& j, ApiServers& s);

}
