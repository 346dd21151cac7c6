#pragma once

#include "pcloud/client/Client.hpp"
#include "pcloud/http/Payload.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pcloud::builders {

enum class UploadStatus {
    Uploaded,   // stored under the submitted name
    Renamed,    // stored under a server-chosen name after a collision
    Conflict,   // not sent: the name exists and renaming was disabled
    Failed,     // sent, but the server reported nothing for it
};

std::string_view toString(UploadStatus s);

struct UploadOutcome {
    std::string name;                       // name as submitted
    UploadStatus status = UploadStatus::Failed;
    std::optional<std::uint64_t> fileId;
    std::optional<types::Metadata> metadata;
    std::string message;
};

struct UploadResult {
    std::vector<UploadOutcome> outcomes;    // one per withFile() call, in call order

    [[nodiscard]] const UploadOutcome* find(const std::string& name) const;
    [[nodiscard]] std::size_t count(UploadStatus status) const;
    [[nodiscard]] bool allStored() const;
};

/**
 * Collects files for a single uploadfile request into one folder.
 *
 * Renaming on collision is on by default. With renameIfExists(false) the
 * folder is listed first and files whose name is taken are reported as
 * Conflict instead of being sent, since uploadfile would otherwise overwrite
 * them. upload() may be called once; the builder rejects changes afterwards.
 */
class UploadBuilder {
public:
    UploadBuilder(client::Client client, types::Identifier folder);

    // Appends; earlier entries with the same name are kept.
    UploadBuilder& withFile(std::string name, http::Payload payload);
    UploadBuilder& renameIfExists(bool value);
    UploadBuilder& noPartial(bool value);
    UploadBuilder& mtime(std::time_t value);
    UploadBuilder& ctime(std::time_t value);

    [[nodiscard]] std::size_t fileCount() const { return files_.size(); }
    [[nodiscard]] bool executed() const { return executed_; }

    std::future<UploadResult> upload();

private:
    void ensureMutable() const;

    client::Client client_;
    types::Identifier folder_;
    std::vector<http::FilePart> files_;
    bool renameIfExists_ = true;
    bool noPartial_ = true;
    std::optional<std::time_t> mtime_, ctime_;
    bool executed_ = false;
};

}
