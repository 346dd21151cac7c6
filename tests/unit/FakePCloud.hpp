#pragma once

#include "FakeTransport.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace pcloud::test {

// Small in-memory pCloud: accounts, session tokens, folders and file contents behind a FakeTransport.
class FakePCloud {
public:
    static constexpr auto CONTENT_HOST = "c1.pcloud.com";
    static constexpr auto DATE = "Thu, 21 Mar 2024 14:05:09 +0000";

    struct Entry {
        std::uint64_t id{};
        bool folder = false;
        std::string name;
        std::uint64_t parent{};
        std::string content;
    };

    explicit FakePCloud(std::string username = "user@example.com", std::string password = "secret")
        : transport(std::make_shared<FakeTransport>()), username_(std::move(username)), password_(std::move(password)) {
        entries_["/"] = Entry{0, true, "", 0, {}};
        install();
    }

    std::shared_ptr<FakeTransport> transport;

    std::uint64_t addFolder(const std::string& path) {
        std::scoped_lock lock(mutex_);
        return insert(path, true, {});
    }

    std::uint64_t addFile(const std::string& path, const std::string& content) {
        std::scoped_lock lock(mutex_);
        return insert(path, false, content);
    }

    [[nodiscard]] bool exists(const std::string& path) const {
        std::scoped_lock lock(mutex_);
        return entries_.contains(path);
    }

    [[nodiscard]] std::string contentOf(const std::string& path) const {
        std::scoped_lock lock(mutex_);
        return entries_.at(path).content;
    }

    [[nodiscard]] std::uint64_t idOf(const std::string& path) const {
        std::scoped_lock lock(mutex_);
        return entries_.at(path).id;
    }

    [[nodiscard]] std::vector<std::string> loggedOut() const {
        std::scoped_lock lock(mutex_);
        return loggedOut_;
    }

    [[nodiscard]] std::size_t liveSessions() const {
        std::scoped_lock lock(mutex_);
        return live_.size();
    }

    // Name getapiserver answers with; empty makes it fail with a server error.
    void setNearestServer(std::string host) {
        std::scoped_lock lock(mutex_);
        nearest_ = std::move(host);
    }

private:
    using json = nlohmann::json;

    static std::string parentOf(const std::string& path) {
        const auto slash = path.rfind('/');
        return slash == 0 ? "/" : path.substr(0, slash);
    }

    static std::string join(const std::string& folder, const std::string& name) {
        return folder == "/" ? "/" + name : folder + "/" + name;
    }

    std::uint64_t insert(const std::string& path, const bool folder, const std::string& content) {
        const auto parent = parentOf(path);
        if (!entries_.contains(parent)) insert(parent, true, {});
        auto& e = entries_[path];
        if (e.id == 0) e.id = nextId_++;
        e.folder = folder;
        e.name = path.substr(path.rfind('/') + 1);
        e.parent = entries_.at(parent).id;
        e.content = content;
        return e.id;
    }

    const std::string* pathById(const std::uint64_t id, const bool folder) const {
        for (const auto& [p, e] : entries_)
            if (e.id == id && e.folder == folder) return &p;
        return nullptr;
    }

    json metadata(const std::string& path, const bool withContents = false) const {
        const auto& e = entries_.at(path);
        json m = {
            {"name", path == "/" ? "/" : e.name},
            {"path", path},
            {"isfolder", e.folder},
            {"parentfolderid", e.parent},
            {"ismine", true},
            {"isshared", false},
            {"thumb", false},
            {"created", DATE},
            {"modified", DATE},
        };
        if (e.folder) {
            m["id"] = "d" + std::to_string(e.id);
            m["folderid"] = e.id;
        } else {
            m["id"] = "f" + std::to_string(e.id);
            m["fileid"] = e.id;
            m["size"] = e.content.size();
            m["contenttype"] = "text/plain";
        }
        if (withContents && e.folder) {
            m["contents"] = json::array();
            for (const auto& [p, child] : entries_)
                if (p != "/" && parentOf(p) == path) m["contents"].push_back(metadata(p));
        }
        return m;
    }

    static http::Response error(const int code, const std::string& message) {
        return FakeTransport::reply({{"result", code}, {"error", message}});
    }

    bool authorized(const http::Request& req) const {
        for (const auto& h : req.headers)
            if (h.rfind("Authorization: Bearer ", 0) == 0) return true;
        const auto token = req.find("auth");
        return token && live_.contains(*token);
    }

    // Resolves "path" or the id parameter named idKey; empty when missing.
    std::string resolve(const http::Request& req, const char* idKey, const bool folder) const {
        if (const auto p = req.find("path")) return entries_.contains(*p) && entries_.at(*p).folder == folder ? *p : "";
        if (const auto id = req.find(idKey)) {
            const auto* p = pathById(std::stoull(*id), folder);
            return p ? *p : "";
        }
        return {};
    }

    std::string freeName(const std::string& folder, const std::string& name) const {
        const auto dot = name.rfind('.');
        const auto stem = dot == std::string::npos ? name : name.substr(0, dot);
        const auto ext = dot == std::string::npos ? "" : name.substr(dot);
        for (int n = 1;; ++n) {
            auto candidate = stem + " (" + std::to_string(n) + ")" + ext;
            if (!entries_.contains(join(folder, candidate))) return candidate;
        }
    }

    void install() {
        transport->on("userinfo", [this](const http::Request& req) {
            std::scoped_lock lock(mutex_);
            if (req.find("getauth")) {
                if (req.find("username") != username_ || req.find("password") != password_)
                    return error(2000, "Log in failed.");
                const auto token = "tok-" + std::to_string(++tokens_);
                live_.insert(token);
                return FakeTransport::reply({{"result", 0}, {"auth", token}, {"email", username_}, {"userid", 42}});
            }
            if (!authorized(req)) return error(1000, "Log in required.");
            return FakeTransport::reply({{"result", 0}, {"email", username_}, {"userid", 42}, {"premium", false},
                                         {"quota", 10737418240ULL}, {"usedquota", 5}, {"registered", DATE}});
        });

        transport->on("getapiserver", [this](const http::Request& req) {
            std::scoped_lock lock(mutex_);
            if (!authorized(req)) return error(1000, "Log in required.");
            if (nearest_.empty()) return error(5000, "Internal error.");
            return FakeTransport::reply({{"result", 0}, {"api", json::array({nearest_})}, {"binapi", json::array({"bin" + nearest_})}});
        });

        transport->on("logout", [this](const http::Request& req) {
            std::scoped_lock lock(mutex_);
            const auto token = req.find("auth");
            if (!token || !live_.erase(*token)) return error(1000, "Log in required.");
            loggedOut_.push_back(*token);
            return FakeTransport::reply({{"result", 0}, {"auth_deleted", true}});
        });

        transport->on("listfolder", [this](const http::Request& req) {
            std::scoped_lock lock(mutex_);
            if (!authorized(req)) return error(1000, "Log in required.");
            const auto folder = resolve(req, "folderid", true);
            if (folder.empty()) return error(2005, "Directory does not exist.");
            return FakeTransport::reply({{"result", 0}, {"metadata", metadata(folder, true)}});
        });

        auto createFolder = [this](const http::Request& req, const bool ifNotExists) {
            std::scoped_lock lock(mutex_);
            if (!authorized(req)) return error(1000, "Log in required.");
            std::string path;
            if (const auto p = req.find("path")) path = *p;
            else if (const auto id = req.find("folderid")) {
                const auto* parent = pathById(std::stoull(*id), true);
                if (!parent) return error(2005, "Directory does not exist.");
                path = join(*parent, req.find("name").value_or(""));
            }
            if (path.empty() || path == "/") return error(2001, "Invalid file/folder name.");
            if (!entries_.contains(parentOf(path))) return error(2002, "A component of parent directory does not exist.");
            if (entries_.contains(path)) {
                if (!ifNotExists) return error(2004, "File or folder already exists.");
            } else {
                insert(path, true, {});
            }
            return FakeTransport::reply({{"result", 0}, {"metadata", metadata(path)}});
        };
        transport->on("createfolder", [createFolder](const http::Request& req) { return createFolder(req, false); });
        transport->on("createfolderifnotexists", [createFolder](const http::Request& req) { return createFolder(req, true); });

        transport->on("uploadfile", [this](const http::Request& req) {
            std::scoped_lock lock(mutex_);
            if (!authorized(req)) return error(1000, "Log in required.");
            const auto folder = resolve(req, "folderid", true);
            if (folder.empty()) return error(2005, "Directory does not exist.");

            const bool rename = req.find("renameifexists") == "1";
            json ids = json::array(), metas = json::array();
            for (const auto& part : req.files) {
                auto name = part.filename;
                if (rename && entries_.contains(join(folder, name))) name = freeName(folder, name);
                const auto path = join(folder, name);
                ids.push_back(insert(path, false, part.payload.readAll()));
                metas.push_back(metadata(path));
            }
            return FakeTransport::reply({{"result", 0}, {"fileids", ids}, {"metadata", metas}});
        });

        transport->on("getfilelink", [this](const http::Request& req) {
            std::scoped_lock lock(mutex_);
            if (!authorized(req)) return error(1000, "Log in required.");
            const auto file = resolve(req, "fileid", false);
            if (file.empty()) return error(2009, "File not found.");
            const auto& e = entries_.at(file);
            return FakeTransport::reply({{"result", 0},
                                         {"path", "/dl/" + std::to_string(e.id) + "/" + e.name},
                                         {"expires", DATE},
                                         {"hosts", json::array({CONTENT_HOST, "c2.pcloud.com"})}});
        });

        transport->onPrefix(std::string("https://") + CONTENT_HOST + "/dl/", [this](const http::Request& req) {
            std::scoped_lock lock(mutex_);
            const auto rest = req.url.substr(std::string("https://").size() + std::string(CONTENT_HOST).size() + 4);
            const auto id = std::stoull(rest.substr(0, rest.find('/')));
            const auto* path = pathById(id, false);
            if (!path) return http::Response{404, "not found", "HTTP/1.1 404 Not Found\r\n\r\n"};
            return http::Response{200, entries_.at(*path).content, "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\n"};
        });
    }

    mutable std::mutex mutex_;
    std::string username_, password_;
    std::string nearest_ = "eapi.pcloud.com";
    std::map<std::string, Entry> entries_;
    std::set<std::string> live_;
    std::vector<std::string> loggedOut_;
    std::uint64_t nextId_ = 1;
    std::uint64_t tokens_ = 0;
};

}
