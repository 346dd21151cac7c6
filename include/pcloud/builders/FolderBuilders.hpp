#pragma once

#include "pcloud/client/Client.hpp"

namespace pcloud::builders {

class ListFolderBuilder {
public:
    ListFolderBuilder(client::Client client, types::Identifier folder);

    ListFolderBuilder& recursive(bool value = true) { recursive_ = value; return *this; }
    ListFolderBuilder& showDeleted(bool value = true) { showDeleted_ = value; return *this; }
    ListFolderBuilder& noFiles(bool value = true) { noFiles_ = value; return *this; }
    ListFolderBuilder& noShares(bool value = true) { noShares_ = value; return *this; }

    [[nodiscard]] http::Request request() const;
    std::future<types::FileOrFolderStat> get() const;

private:
    client::Client client_;
    types::Identifier folder_;
    bool recursive_ = false, showDeleted_ = false, noFiles_ = false, noShares_ = false;
};

class CreateFolderBuilder {
public:
    CreateFolderBuilder(client::Client client, types::Identifier parent, std::string name);

    // Succeed without error when the folder already exists (default).
    CreateFolderBuilder& ifNotExists(bool value) { ifNotExists_ = value; return *this; }

    [[nodiscard]] http::Request request() const;
    std::future<types::FileOrFolderStat> execute() const;

private:
    client::Client client_;
    types::Identifier parent_;
    std::string name_;
    bool ifNotExists_ = true;
};

class DeleteFolderBuilder {
public:
    DeleteFolderBuilder(client::Client client, types::Identifier folder);

    [[nodiscard]] http::Request request(bool recursive) const;

    // Fails with FolderIsNotEmpty unless the folder is empty.
    std::future<types::FileOrFolderStat> deleteIfEmpty() const;
    std::future<types::FolderDeleted> deleteRecursive() const;

private:
    client::Client client_;
    types::Identifier folder_;
};

class CopyFolderBuilder {
public:
    CopyFolderBuilder(client::Client client, types::Identifier folder, types::Identifier target);

    CopyFolderBuilder& overwrite(bool value) { overwrite_ = value; return *this; }
    CopyFolderBuilder& skipExisting(bool value = true) { skipExisting_ = value; return *this; }
    CopyFolderBuilder& copyContentOnly(bool value = true) { copyContentOnly_ = value; return *this; }

    [[nodiscard]] http::Request request() const;
    std::future<types::FileOrFolderStat> execute() const;

private:
    client::Client client_;
    types::Identifier folder_, target_;
    bool overwrite_ = true, skipExisting_ = false, copyContentOnly_ = false;
};

class MoveFolderBuilder {
public:
    MoveFolderBuilder(client::Client client, types::Identifier folder, types::Identifier target);

    MoveFolderBuilder& withNewName(std::string name) { newName_ = std::move(name); return *this; }

    [[nodiscard]] http::Request request() const;
    std::future<types::FileOrFolderStat> execute() const;

private:
    client::Client client_;
    types::Identifier folder_, target_;
    std::optional<std::string> newName_;
};

}
