#include "pcloud/types/Metadata.hpp"
#include "pcloud/util/timestamp.hpp"

#include <nlohmann/json.hpp>

#include <unordered_map>

using namespace pcloud::types;
using namespace pcloud::util;
using json = nlohmann::json;

namespace {

template<typename T>
void opt(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) out = j.at(key).get<T>();
    else out = std::nullopt;
}

template<typename T>
void req(const json& j, const char* key, T& out, const T& def = T{}) {
    out = j.contains(key) && !j.at(key).is_null() ? j.at(key).get<T>() : def;
}

std::optional<std::time_t> optDate(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) return std::nullopt;
    return parsePCloudTimestamp(j.at(key).get<std::string>());
}

std::time_t date(const json& j, const char* key) {
    return optDate(j, key).value_or(0);
}

}

const Metadata* Metadata::child(const std::string& childName) const {
    for (const auto& c : contents)
        if (c.name == childName) return &c;
    return nullptr;
}

void pcloud::types::from_json(const json& j, Metadata& m) {
    req(j, "parentfolderid", m.parentfolderid);
    req(j, "isfolder", m.isfolder);
    req(j, "ismine", m.ismine, true);
    req(j, "isshared", m.isshared);
    req(j, "thumb", m.thumb);
    req(j, "name", m.name);
    req(j, "id", m.id);
    opt(j, "folderid", m.folderid);
    opt(j, "fileid", m.fileid);
    opt(j, "userid", m.userid);
    opt(j, "size", m.size);
    opt(j, "hash", m.hash);
    opt(j, "canread", m.canread);
    opt(j, "canmodify", m.canmodify);
    opt(j, "candelete", m.candelete);
    opt(j, "cancreate", m.cancreate);
    opt(j, "isdeleted", m.isdeleted);
    opt(j, "path", m.path);
    opt(j, "icon", m.icon);
    opt(j, "contenttype", m.contenttype);

    if (j.contains("category") && j.at("category").is_number_integer())
        m.category = static_cast<FileCategory>(j.at("category").get<int>());
    else m.category = std::nullopt;

    m.created = date(j, "created");
    m.modified = date(j, "modified");

    m.contents.clear();
    if (j.contains("contents") && j.at("contents").is_array())
        for (const auto& c : j.at("contents")) m.contents.push_back(c.get<Metadata>());
}

void pcloud::types::to_json(json& j, const Metadata& m) {
    j = {
        {"parentfolderid", m.parentfolderid},
        {"isfolder", m.isfolder},
        {"ismine", m.ismine},
        {"isshared", m.isshared},
        {"thumb", m.thumb},
        {"name", m.name},
        {"id", m.id},
        {"created", formatPCloudTimestamp(m.created)},
        {"modified", formatPCloudTimestamp(m.modified)},
    };
    if (m.folderid) j["folderid"] = *m.folderid;
    if (m.fileid) j["fileid"] = *m.fileid;
    if (m.size) j["size"] = *m.size;
    if (m.hash) j["hash"] = *m.hash;
    if (m.path) j["path"] = *m.path;
    if (m.icon) j["icon"] = *m.icon;
    if (m.contenttype) j["contenttype"] = *m.contenttype;
    if (m.category) j["category"] = static_cast<int>(*m.category);
    if (!m.contents.empty()) j["contents"] = m.contents;
}

void pcloud::types::from_json(const json& j, FileOrFolderStat& s) {
    opt(j, "metadata", s.metadata);
}

void pcloud::types::from_json(const json& j, FolderDeleted& d) {
    req(j, "deletedfiles", d.deletedfiles);
    req(j, "deletedfolders", d.deletedfolders);
}

std::map<std::string, std::string> FileChecksums::toChecksumSet() const {
    std::map<std::string, std::string> set;
    if (sha1) set["sha1"] = *sha1;
    if (md5) set["md5"] = *md5;
    if (sha256) set["sha256"] = *sha256;
    return set;
}

void pcloud::types::from_json(const json& j, FileChecksums& c) {
    opt(j, "metadata", c.metadata);
    opt(j, "sha1", c.sha1);
    opt(j, "md5", c.md5);
    opt(j, "sha256", c.sha256);
}

void pcloud::types::from_json(const json& j, UserInfo& u) {
    opt(j, "auth", u.auth);
    opt(j, "userid", u.userid);
    opt(j, "usedquota", u.usedquota);
    opt(j, "quota", u.quota);
    opt(j, "email", u.email);
    opt(j, "language", u.language);
    opt(j, "emailverified", u.emailverified);
    opt(j, "premium", u.premium);
    u.registered = optDate(j, "registered");
}

std::string DownloadLink::url() const {
    if (hosts.empty() || !path) return {};
    return "https://" + hosts.front() + *path;
}

void pcloud::types::from_json(const json& j, DownloadLink& l) {
    opt(j, "path", l.path);
    l.expires = optDate(j, "expires");
    req(j, "hosts", l.hosts);
}

void pcloud::types::from_json(const json& j, PublicFileLink& l) {
    opt(j, "linkid", l.linkid);
    opt(j, "downloads", l.downloads);
    opt(j, "code", l.code);
    opt(j, "link", l.link);
    opt(j, "shortcode", l.shortcode);
    opt(j, "shortlink", l.shortlink);
    opt(j, "metadata", l.metadata);
    opt(j, "downloadenabled", l.downloadenabled);
    l.created = optDate(j, "created");
    l.modified = optDate(j, "modified");
}

void pcloud::types::from_json(const json& j, Revision& r) {
    req(j, "revisionid", r.revisionid);
    req(j, "size", r.size);
    opt(j, "hash", r.hash);
    r.created = date(j, "created");
}

void pcloud::types::from_json(const json& j, RevisionList& r) {
    opt(j, "metadata", r.metadata);
    req(j, "revisions", r.revisions);
}

DiffEvent pcloud::types::diffEventFromString(const std::string& s) {
    static const std::unordered_map<std::string, DiffEvent> events = {
        {"reset", DiffEvent::Reset},
        {"createfolder", DiffEvent::CreateFolder},
        {"deletefolder", DiffEvent::DeleteFolder},
        {"modifyfolder", DiffEvent::ModifyFolder},
        {"createfile", DiffEvent::CreateFile},
        {"modifyfile", DiffEvent::ModifyFile},
        {"deletefile", DiffEvent::DeleteFile},
        {"requestsharein", DiffEvent::RequestShareIn},
        {"acceptedsharein", DiffEvent::AcceptedShareIn},
        {"declinedsharein", DiffEvent::DeclinedShareIn},
        {"declinedshareout", DiffEvent::DeclinedShareOut},
        {"cancelledsharein", DiffEvent::CancelledShareIn},
        {"removedsharein", DiffEvent::RemovedShareIn},
        {"modifiedsharein", DiffEvent::ModifiedShareIn},
        {"modifyuserinfo", DiffEvent::ModifyUserInfo},
    };
    const auto it = events.find(s);
    return it == events.end() ? DiffEvent::Unknown : it->second;
}

void pcloud::types::from_json(const json& j, DiffEntry& e) {
    e.time = date(j, "time");
    req(j, "diffid", e.diffid);
    e.event = diffEventFromString(j.value("event", std::string{}));
    opt(j, "metadata", e.metadata);
}

void pcloud::types::from_json(const json& j, Diff& d) {
    req(j, "diffid", d.diffid);
    req(j, "entries", d.entries);
}

void pcloud::types::from_json(const json& j, ApiServers& s) {
    req(j, "api", s.api);
    req(j, "binapi", s.binapi);
}
