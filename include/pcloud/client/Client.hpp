#pragma once

#include "pcloud/auth/Credentials.hpp"
#include "pcloud/checksum/ChecksumPolicy.hpp"
#include "pcloud/concurrency/ThreadPoolManager.hpp"
#include "pcloud/errors/Errors.hpp"
#include "pcloud/http/Transport.hpp"
#include "pcloud/types/Identifier.hpp"
#include "pcloud/types/Metadata.hpp"

#include <nlohmann/json.hpp>

#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pcloud::builders {
class ListFolderBuilder;
class CreateFolderBuilder;
class DeleteFolderBuilder;
class CopyFolderBuilder;
class MoveFolderBuilder;
class UploadBuilder;
class CopyFileBuilder;
class MoveFileBuilder;
class ChecksumFileBuilder;
class DownloadLinkBuilder;
class PublicLinkBuilder;
class DiffBuilder;
}

namespace pcloud::client {

/**
 * Handle to one pCloud account on one API host.
 *
 * Copies are cheap and share the credentials; for password logins the session
 * token is revoked once the last copy (including the copies captured by
 * in-flight operations) is gone. Operations run on the shared worker pool and
 * report results or errors through std::future.
 */
class Client {
public:
    // No network traffic. Throws errors::ConfigurationError for a malformed host or an empty token.
    static Client withOAuth(const std::string& host,
                            const std::string& token,
                            std::shared_ptr<http::Transport> transport = nullptr);

    // Host is validated synchronously; login and server lookup happen on the pool.
    static std::future<Client> withUsernameAndPassword(const std::string& host,
                                                       const std::string& username,
                                                       const std::string& password,
                                                       std::shared_ptr<http::Transport> transport = nullptr);

    [[nodiscard]] const std::string& apiHost() const { return apiHost_; }
    [[nodiscard]] checksum::Region region() const { return region_; }
    [[nodiscard]] const auth::Credentials& credentials() const { return credentials_; }
    [[nodiscard]] const std::shared_ptr<http::Transport>& transport() const { return transport_; }

    // Folders
    [[nodiscard]] builders::ListFolderBuilder listFolder(const types::Identifier& folder) const;
    [[nodiscard]] builders::CreateFolderBuilder createFolder(const types::Identifier& parent, std::string name) const;
    [[nodiscard]] builders::DeleteFolderBuilder deleteFolder(const types::Identifier& folder) const;
    [[nodiscard]] builders::CopyFolderBuilder copyFolder(const types::Identifier& folder, const types::Identifier& target) const;
    [[nodiscard]] builders::MoveFolderBuilder moveFolder(const types::Identifier& folder, const types::Identifier& target) const;

    // Files
    [[nodiscard]] builders::UploadBuilder uploadFileIntoFolder(const types::Identifier& folder) const;
    [[nodiscard]] builders::CopyFileBuilder copyFile(const types::Identifier& file, const types::Identifier& target) const;
    [[nodiscard]] builders::MoveFileBuilder moveFile(const types::Identifier& file, const types::Identifier& target) const;
    [[nodiscard]] builders::ChecksumFileBuilder checksumFile(const types::Identifier& file) const;
    [[nodiscard]] builders::DownloadLinkBuilder getDownloadLinkForFile(const types::Identifier& file) const;
    [[nodiscard]] builders::PublicLinkBuilder getPublicLinkForFile(const types::Identifier& file) const;

    std::future<types::FileOrFolderStat> getFileMetadata(const types::Identifier& file) const;
    std::future<types::FileOrFolderStat> deleteFile(const types::Identifier& file) const;
    std::future<types::RevisionList> listFileRevisions(const types::Identifier& file) const;

    // Resolves a public link code (optionally a single file inside a shared folder).
    std::future<types::DownloadLink> getPublicDownloadLink(const std::string& code,
                                                           std::optional<std::uint64_t> fileId = std::nullopt) const;

    // Fetches the content behind a resolved link. No credentials are sent to the content host.
    std::future<http::Response> downloadLink(const types::DownloadLink& link) const;

    // getfilelink followed by the content fetch.
    std::future<http::Response> downloadFile(const types::Identifier& file) const;

    std::future<types::UserInfo> getUserInfo() const;

    [[nodiscard]] builders::DiffBuilder diff() const;

    // Plumbing shared with the builders
    [[nodiscard]] http::Request newRequest(http::Method method, const std::string& apiMethod) const;

    // Performs the request and returns the JSON reply; throws errors::ServerError on a non-zero result.
    nlohmann::json execute(const http::Request& req) const;

    // Converts a reply into T. A reply of the wrong shape throws errors::ServerError with code -1.
    template<typename T>
    static T decode(const nlohmann::json& reply, std::string_view apiMethod) {
        try {
            return reply.get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw malformedReply(apiMethod, e.what());
        } catch (const std::invalid_argument& e) {
            throw malformedReply(apiMethod, e.what());
        }
    }

    // execute() followed by decode().
    template<typename T>
    T executeAs(const http::Request& req) const {
        return decode<T>(execute(req), req.apiMethod());
    }

    // Synchronous GET of a resolved download link; throws errors::ServerError on a non-2xx status.
    http::Response fetchContent(const types::DownloadLink& link) const;

    // Throws errors::ConfigurationError for relative paths.
    static void requireValid(const types::Identifier& id, std::string_view role);

    template<typename F>
    auto dispatch(F&& fn) const {
        auto work = [self = *this, fn = std::forward<F>(fn)]() { return fn(self); };
        using R = std::invoke_result_t<decltype(work)>;

        if (const auto pool = concurrency::ThreadPoolManager::instance().httpPool())
            return pool->async(std::move(work));

        concurrency::PromisedTask<R> task(std::move(work));
        auto fut = task.getFuture();
        task();
        return fut;
    }

private:
    static errors::ServerError malformedReply(std::string_view apiMethod, std::string_view detail);

    Client(std::string apiHost, checksum::Region region, auth::Credentials credentials,
           std::shared_ptr<http::Transport> transport);

    std::string apiHost_;
    checksum::Region region_;
    auth::Credentials credentials_;
    std::shared_ptr<http::Transport> transport_;
};

// Returns the host without a trailing slash; throws errors::ConfigurationError if it is not http(s)://name[:port].
std::string normalizeHost(const std::string& host);

}
