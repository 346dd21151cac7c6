#include "pcloud/builders/FolderBuilders.hpp"

using namespace pcloud::builders;
using namespace pcloud::client;
using namespace pcloud::types;
using pcloud::http::Method;
using pcloud::http::Request;

ListFolderBuilder::ListFolderBuilder(Client client, Identifier folder)
    : client_(std::move(client)), folder_(std::move(folder)) {}

Request ListFolderBuilder::request() const {
    auto req = client_.newRequest(Method::Get, "listfolder");
    req.param(folder_.param(EntityKind::Folder));
    if (recursive_) req.param("recursive", "1");
    if (showDeleted_) req.param("showdeleted", "1");
    if (noFiles_) req.param("nofiles", "1");
    if (noShares_) req.param("noshares", "1");
    return req;
}

std::future<FileOrFolderStat> ListFolderBuilder::get() const {
    return client_.dispatch([req = request()](const Client& c) {
        return c.executeAs<FileOrFolderStat>(req);
    });
}

CreateFolderBuilder::CreateFolderBuilder(Client client, Identifier parent, std::string name)
    : client_(std::move(client)), parent_(std::move(parent)), name_(std::move(name)) {}

Request CreateFolderBuilder::request() const {
    auto req = client_.newRequest(Method::Get, ifNotExists_ ? "createfolderifnotexists" : "createfolder");
    if (parent_.isPath()) {
        // path addressing takes the full path of the new folder
        const auto& p = parent_.path();
        req.param("path", (p.back() == '/' ? p : p + "/") + name_);
    } else {
        req.param("folderid", std::to_string(parent_.id()));
        req.param("name", name_);
    }
    return req;
}

std::future<FileOrFolderStat> CreateFolderBuilder::execute() const {
    return client_.dispatch([req = request()](const Client& c) {
        return c.executeAs<FileOrFolderStat>(req);
    });
}

DeleteFolderBuilder::DeleteFolderBuilder(Client client, Identifier folder)
    : client_(std::move(client)), folder_(std::move(folder)) {}

Request DeleteFolderBuilder::request(const bool recursive) const {
    auto req = client_.newRequest(Method::Get, recursive ? "deletefolderrecursive" : "deletefolder");
    req.param(folder_.param(EntityKind::Folder));
    return req;
}

std::future<FileOrFolderStat> DeleteFolderBuilder::deleteIfEmpty() const {
    return client_.dispatch([req = request(false)](const Client& c) {
        return c.executeAs<FileOrFolderStat>(req);
    });
}

std::future<FolderDeleted> DeleteFolderBuilder::deleteRecursive() const {
    return client_.dispatch([req = request(true)](const Client& c) {
        return c.executeAs<FolderDeleted>(req);
    });
}

CopyFolderBuilder::CopyFolderBuilder(Client client, Identifier folder, Identifier target)
    : client_(std::move(client)), folder_(std::move(folder)), target_(std::move(target)) {}

Request CopyFolderBuilder::request() const {
    auto req = client_.newRequest(Method::Get, "copyfolder");
    req.param(folder_.param(EntityKind::Folder));
    req.param(target_.targetParam());
    if (!overwrite_) req.param("noover", "1");
    if (skipExisting_) req.param("skipexisting", "1");
    if (copyContentOnly_) req.param("copycontentonly", "1");
    return req;
}

std::future<FileOrFolderStat> CopyFolderBuilder::execute() const {
    return client_.dispatch([req = request()](const Client& c) {
        return c.executeAs<FileOrFolderStat>(req);
    });
}

MoveFolderBuilder::MoveFolderBuilder(Client client, Identifier folder, Identifier target)
    : client_(std::move(client)), folder_(std::move(folder)), target_(std::move(target)) {}

Request MoveFolderBuilder::request() const {
    auto req = client_.newRequest(Method::Get, "renamefolder");
    req.param(folder_.param(EntityKind::Folder));
    req.param(target_.targetParam());
    if (newName_) req.param("toname", *newName_);
    return req;
}

std::future<FileOrFolderStat> MoveFolderBuilder::execute() const {
    return client_.dispatch([req = request()](const Client& c) {
        return c.executeAs<FileOrFolderStat>(req);
    });
}
