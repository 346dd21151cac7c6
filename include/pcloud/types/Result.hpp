#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

namespace pcloud::types {

// Result codes returned in the "result" field of every pCloud reply.
enum class ResultCode : int {
    Ok = 0,
    LogInRequired = 1000,
    NoFullPathOrNameOrFolderIdProvided = 1001,
    NoFullPathOrFolderIdProvided = 1002,
    NoFileIdOrPathProvided = 1004,
    DateTimeFormatNotUnderstood = 1013,
    ProvideAtLeastToPathOrToFolderIdOrToName = 1037,
    ProvideUrl = 1040,
    LoginFailed = 2000,
    InvalidFileOrFolderName = 2001,
    ComponentOfParentDirectoryDoesNotExist = 2002,
    AccessDenied = 2003,
    DirectoryDoesNotExist = 2005,
    FolderIsNotEmpty = 2006,
    CannotDeleteRootFolder = 2007,
    UserOverQuota = 2008,
    FileNotFound = 2009,
    InvalidPath = 2010,
    VerifyMailAddress = 2014,
    SharedFolderInSharedFolder = 2023,
    CanOnlyShareOwnFiles = 2026,
    ActiveSharesForFolder = 2028,
    ConnectionBroken = 2041,
    CannotRenameRootFolder = 2042,
    CannotMoveFolderIntoItself = 2043,
    TooManyLogins = 4000,
    InternalError = 5000,
    InternalUploadError = 5001,
};

[[nodiscard]] std::string_view describe(int code);
[[nodiscard]] inline std::string_view describe(ResultCode code) { return describe(static_cast<int>(code)); }

[[nodiscard]] int resultOf(const nlohmann::json& reply);

// Throws errors::ServerError if the reply carries a non-zero result.
void ensureOk(const nlohmann::json& reply, std::string_view context);

}
