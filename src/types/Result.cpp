#include "pcloud/types/Result.hpp"
#include "pcloud/errors/Errors.hpp"
#include "pcloud/logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

using namespace pcloud::logging;

namespace pcloud::types {

std::string_view describe(const int code) {
    switch (static_cast<ResultCode>(code)) {
        case ResultCode::Ok: return "Everything ok";
        case ResultCode::LogInRequired: return "Log in required";
        case ResultCode::NoFullPathOrNameOrFolderIdProvided: return "No full path or name/folderid provided";
        case ResultCode::NoFullPathOrFolderIdProvided: return "No full path or folder id provided";
        case ResultCode::NoFileIdOrPathProvided: return "No file id or file path provided";
        case ResultCode::DateTimeFormatNotUnderstood: return "Date time format not understood";
        case ResultCode::ProvideAtLeastToPathOrToFolderIdOrToName:
            return "Please provide at least one of 'topath', 'tofolderid' or 'toname'";
        case ResultCode::ProvideUrl: return "Provide url";
        case ResultCode::LoginFailed: return "Log in failed";
        case ResultCode::InvalidFileOrFolderName: return "Invalid file or folder name";
        case ResultCode::ComponentOfParentDirectoryDoesNotExist: return "A component of the parent directory does not exist";
        case ResultCode::AccessDenied: return "Access denied";
        case ResultCode::DirectoryDoesNotExist: return "Directory does not exist";
        case ResultCode::FolderIsNotEmpty: return "Folder is not empty";
        case ResultCode::CannotDeleteRootFolder: return "Cannot delete the root folder";
        case ResultCode::UserOverQuota: return "User over quota";
        case ResultCode::FileNotFound: return "File not found";
        case ResultCode::InvalidPath: return "Invalid path";
        case ResultCode::VerifyMailAddress: return "Please verify your mail address to perform this action";
        case ResultCode::SharedFolderInSharedFolder: return "Cannot place a shared folder into another shared folder";
        case ResultCode::CanOnlyShareOwnFiles: return "You can only share your own files or folders";
        case ResultCode::ActiveSharesForFolder: return "There are active shares or share requests for this folder";
        case ResultCode::ConnectionBroken: return "Connection broken";
        case ResultCode::CannotRenameRootFolder: return "Cannot rename the root folder";
        case ResultCode::CannotMoveFolderIntoItself: return "Cannot move a folder to a subfolder of itself";
        case ResultCode::TooManyLogins: return "Too many logins";
        case ResultCode::InternalError: return "Internal error";
        case ResultCode::InternalUploadError: return "Internal upload error";
    }
    return "Unknown error";
}

int resultOf(const nlohmann::json& reply) {
    if (!reply.is_object() || !reply.contains("result") || !reply["result"].is_number_integer())
        throw errors::ServerError(-1, "reply carries no result code");
    return reply["result"].get<int>();
}

void ensureOk(const nlohmann::json& reply, const std::string_view context) {
    const int code = resultOf(reply);
    if (code == 0) return;

    std::string message = reply.contains("error") && reply["error"].is_string()
                              ? reply["error"].get<std::string>()
                              : std::string(describe(code));

    LogRegistry::client()->debug("[{}] pCloud returned {}: {}", context, code, message);
    throw errors::ServerError(code, std::move(message));
}

}
