#include "pcloud/client/Client.hpp"
#include "pcloud/auth/Session.hpp"
#include "pcloud/builders/FileBuilders.hpp"
#include "pcloud/builders/FolderBuilders.hpp"
#include "pcloud/builders/UploadBuilder.hpp"
#include "pcloud/config/ConfigRegistry.hpp"
#include "pcloud/errors/Errors.hpp"
#include "pcloud/http/CurlTransport.hpp"
#include "pcloud/logging/LogRegistry.hpp"
#include "pcloud/types/Result.hpp"

#include <fmt/format.h>

#include <regex>

using namespace pcloud::client;
using namespace pcloud::errors;
using namespace pcloud::logging;
using namespace pcloud::types;

namespace {

std::shared_ptr<pcloud::http::Transport> defaultTransport(std::shared_ptr<pcloud::http::Transport> transport) {
    if (transport) return transport;
    const auto cfg = pcloud::config::ConfigRegistry::get().transport;
    return std::make_shared<pcloud::http::CurlTransport>(pcloud::http::CurlOptions::fromConfig(cfg));
}


}

namespace pcloud::client {

std::string normalizeHost(const std::string& host) {
    static const std::regex pattern(R"(^https?://([A-Za-z0-9.-]+|\d{1,3}(?:\.\d{1,3}){3})(:\d{1,5})?/?$)");
    if (!std::regex_match(host, pattern))
        throw ConfigurationError(fmt::format("Invalid pCloud API host: '{}'", host));
    return host.back() == '/' ? host.substr(0, host.size() - 1) : host;
}

}

Client::Client(std::string apiHost, const checksum::Region region, auth::Credentials credentials,
               std::shared_ptr<http::Transport> transport)
    : apiHost_(std::move(apiHost)), region_(region),
      credentials_(std::move(credentials)), transport_(std::move(transport)) {}

Client Client::withOAuth(const std::string& host, const std::string& token,
                         std::shared_ptr<http::Transport> transport) {
    auto apiHost = normalizeHost(host);
    if (token.empty()) throw ConfigurationError("OAuth token must not be empty");

    const auto region = checksum::regionForHost(apiHost);
    return {std::move(apiHost), region, auth::Credentials::fromOAuth(token), defaultTransport(std::move(transport))};
}

std::future<Client> Client::withUsernameAndPassword(const std::string& host,
                                                    const std::string& username,
                                                    const std::string& password,
                                                    std::shared_ptr<http::Transport> transport) {
    auto loginHost = normalizeHost(host);
    transport = defaultTransport(std::move(transport));

    auto work = [loginHost, username, password, transport]() -> Client {
        const auto session = auth::Session::login(loginHost, username, password, transport);
        Client client(loginHost, checksum::regionForHost(loginHost), auth::Credentials::fromSession(session), transport);

        if (!config::ConfigRegistry::get().api.resolve_nearest_server) return client;

        try {
            const auto servers = client.executeAs<ApiServers>(client.newRequest(http::Method::Get, "getapiserver"));
            if (!servers.api.empty()) {
                client.apiHost_ = "https://" + servers.api.front();
                LogRegistry::client()->debug("[Client] Using nearest API server {}", client.apiHost_);
            }
        } catch (const ServerError& e) {
            LogRegistry::client()->warn("[Client] getapiserver failed, staying on {}: {}", loginHost, e.what());
        }
        return client;
    };

    if (const auto pool = concurrency::ThreadPoolManager::instance().httpPool())
        return pool->async(std::move(work));

    concurrency::PromisedTask<Client> task(std::move(work));
    auto fut = task.getFuture();
    task();
    return fut;
}

void Client::requireValid(const Identifier& id, const std::string_view role) {
    if (!id.isValid())
        throw ConfigurationError(fmt::format("{} must be an absolute path or a numeric id, got '{}'", role, id.toString()));
}

pcloud::http::Request Client::newRequest(const http::Method method, const std::string& apiMethod) const {
    http::Request req;
    req.method = method;
    req.url = apiHost_ + "/" + apiMethod;
    credentials_.attach(req);
    return req;
}

pcloud::errors::ServerError Client::malformedReply(const std::string_view apiMethod, const std::string_view detail) {
    LogRegistry::client()->warn("[Client] Malformed {} reply: {}", apiMethod, detail);
    return {-1, fmt::format("malformed {} reply: {}", apiMethod, detail)};
}

nlohmann::json Client::execute(const http::Request& req) const {
    const auto reply = transport_->perform(req).json();
    ensureOk(reply, req.apiMethod());
    return reply;
}

pcloud::builders::ListFolderBuilder Client::listFolder(const Identifier& folder) const {
    requireValid(folder, "folder");
    return {*this, folder};
}

pcloud::builders::CreateFolderBuilder Client::createFolder(const Identifier& parent, std::string name) const {
    requireValid(parent, "parent folder");
    if (name.empty() || name.find('/') != std::string::npos)
        throw ConfigurationError(fmt::format("Invalid folder name '{}'", name));
    return {*this, parent, std::move(name)};
}

pcloud::builders::DeleteFolderBuilder Client::deleteFolder(const Identifier& folder) const {
    requireValid(folder, "folder");
    return {*this, folder};
}

pcloud::builders::CopyFolderBuilder Client::copyFolder(const Identifier& folder, const Identifier& target) const {
    requireValid(folder, "folder");
    requireValid(target, "target folder");
    return {*this, folder, target};
}

pcloud::builders::MoveFolderBuilder Client::moveFolder(const Identifier& folder, const Identifier& target) const {
    requireValid(folder, "folder");
    requireValid(target, "target folder");
    return {*this, folder, target};
}

pcloud::builders::UploadBuilder Client::uploadFileIntoFolder(const Identifier& folder) const {
    requireValid(folder, "target folder");
    return {*this, folder};
}

pcloud::builders::CopyFileBuilder Client::copyFile(const Identifier& file, const Identifier& target) const {
    requireValid(file, "file");
    requireValid(target, "target folder");
    return {*this, file, target};
}

pcloud::builders::MoveFileBuilder Client::moveFile(const Identifier& file, const Identifier& target) const {
    requireValid(file, "file");
    requireValid(target, "target folder");
    return {*this, file, target};
}

pcloud::builders::ChecksumFileBuilder Client::checksumFile(const Identifier& file) const {
    requireValid(file, "file");
    return {*this, file};
}

pcloud::builders::DownloadLinkBuilder Client::getDownloadLinkForFile(const Identifier& file) const {
    requireValid(file, "file");
    return {*this, file};
}

pcloud::builders::PublicLinkBuilder Client::getPublicLinkForFile(const Identifier& file) const {
    requireValid(file, "file");
    return {*this, file};
}

pcloud::builders::DiffBuilder Client::diff() const {
    return builders::DiffBuilder(*this);
}

std::future<FileOrFolderStat> Client::getFileMetadata(const Identifier& file) const {
    requireValid(file, "file");
    return dispatch([file](const Client& c) {
        auto req = c.newRequest(http::Method::Get, "stat");
        req.param(file.param(EntityKind::File));
        return c.executeAs<FileOrFolderStat>(req);
    });
}

std::future<FileOrFolderStat> Client::deleteFile(const Identifier& file) const {
    requireValid(file, "file");
    return dispatch([file](const Client& c) {
        auto req = c.newRequest(http::Method::Get, "deletefile");
        req.param(file.param(EntityKind::File));
        return c.executeAs<FileOrFolderStat>(req);
    });
}

std::future<RevisionList> Client::listFileRevisions(const Identifier& file) const {
    requireValid(file, "file");
    return dispatch([file](const Client& c) {
        auto req = c.newRequest(http::Method::Get, "listrevisions");
        req.param(file.param(EntityKind::File));
        return c.executeAs<RevisionList>(req);
    });
}

std::future<DownloadLink> Client::getPublicDownloadLink(const std::string& code,
                                                        const std::optional<std::uint64_t> fileId) const {
    if (code.empty()) throw ConfigurationError("Public link code must not be empty");
    return dispatch([code, fileId](const Client& c) {
        auto req = c.newRequest(http::Method::Get, "getpublinkdownload");
        req.param("code", code);
        if (fileId) req.param("fileid", std::to_string(*fileId));
        return c.executeAs<DownloadLink>(req);
    });
}

pcloud::http::Response Client::fetchContent(const DownloadLink& link) const {
    const auto url = link.url();
    if (url.empty()) throw ServerError(-1, "download link carries no host or path");

    http::Request req;
    req.url = url;
    auto res = transport_->perform(req);
    if (!res.ok()) {
        LogRegistry::client()->warn("[Client] Content fetch returned HTTP {}", res.status);
        throw ServerError(static_cast<int>(res.status), fmt::format("content download failed with HTTP {}", res.status));
    }
    return res;
}

std::future<pcloud::http::Response> Client::downloadLink(const DownloadLink& link) const {
    return dispatch([link](const Client& c) { return c.fetchContent(link); });
}

std::future<pcloud::http::Response> Client::downloadFile(const Identifier& file) const {
    return getDownloadLinkForFile(file).download();
}

std::future<UserInfo> Client::getUserInfo() const {
    return dispatch([](const Client& c) {
        return c.executeAs<UserInfo>(c.newRequest(http::Method::Get, "userinfo"));
    });
}
