#include "pcloud/builders/UploadBuilder.hpp"
#include "pcloud/errors/Errors.hpp"
#include "pcloud/logging/LogRegistry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <set>
#include <stdexcept>

using namespace pcloud::builders;
using namespace pcloud::client;
using namespace pcloud::types;
using namespace pcloud::logging;
using pcloud::http::FilePart;
using pcloud::http::Method;

namespace {

struct UploadPlan {
    Identifier folder;
    std::vector<FilePart> files;
    bool renameIfExists;
    bool noPartial;
    std::optional<std::time_t> mtime, ctime;
};

std::set<std::string> existingNames(const Client& c, const Identifier& folder) {
    auto req = c.newRequest(Method::Get, "listfolder");
    req.param(folder.param(EntityKind::Folder));
    req.param("noshares", "1");

    const auto stat = c.executeAs<FileOrFolderStat>(req);
    std::set<std::string> names;
    if (stat.metadata)
        for (const auto& entry : stat.metadata->contents) names.insert(entry.name);
    return names;
}

// uploadfile answers in submission order: metadata[k] and fileids[k] belong to the k-th sent file.
void assignMetadata(UploadResult& result, const std::vector<std::size_t>& sent,
                    const std::vector<Metadata>& metadata, const std::vector<std::uint64_t>& fileIds) {
    for (std::size_t k = 0; k < sent.size(); ++k) {
        auto& out = result.outcomes[sent[k]];
        if (k >= metadata.size()) {
            out.status = UploadStatus::Failed;
            out.message = "server reported no metadata for this file";
            continue;
        }

        out.metadata = metadata[k];
        out.fileId = metadata[k].fileid;
        if (!out.fileId && k < fileIds.size()) out.fileId = fileIds[k];
        if (metadata[k].name == out.name) {
            out.status = UploadStatus::Uploaded;
        } else {
            out.status = UploadStatus::Renamed;
            out.message = fmt::format("stored as '{}'", metadata[k].name);
        }
    }
}

UploadResult runUpload(const Client& c, const UploadPlan& plan) {
    UploadResult result;
    result.outcomes.reserve(plan.files.size());
    for (const auto& f : plan.files) result.outcomes.push_back({f.filename, UploadStatus::Failed, {}, {}, {}});

    std::vector<std::size_t> sent;
    if (plan.renameIfExists) {
        for (std::size_t i = 0; i < plan.files.size(); ++i) sent.push_back(i);
    } else {
        auto taken = existingNames(c, plan.folder);
        for (std::size_t i = 0; i < plan.files.size(); ++i) {
            const auto& name = plan.files[i].filename;
            if (!taken.insert(name).second) {
                result.outcomes[i].status = UploadStatus::Conflict;
                result.outcomes[i].message = fmt::format("'{}' already exists in {}", name, plan.folder.toString());
                LogRegistry::upload()->warn("[UploadBuilder] Skipping '{}': name already taken in {}",
                                            name, plan.folder.toString());
            } else {
                sent.push_back(i);
            }
        }
    }

    if (sent.empty()) return result;

    auto req = c.newRequest(Method::Post, "uploadfile");
    req.param(plan.folder.param(EntityKind::Folder));
    if (plan.noPartial) req.param("nopartial", "1");
    if (plan.renameIfExists) req.param("renameifexists", "1");
    if (plan.mtime) req.param("mtime", std::to_string(*plan.mtime));
    if (plan.mtime && plan.ctime) req.param("ctime", std::to_string(*plan.ctime));
    for (const auto i : sent) req.files.push_back(plan.files[i]);

    const auto reply = c.execute(req);

    std::vector<Metadata> metadata;
    std::vector<std::uint64_t> fileIds;
    if (reply.contains("metadata")) metadata = Client::decode<std::vector<Metadata>>(reply.at("metadata"), "uploadfile");
    if (reply.contains("fileids")) fileIds = Client::decode<std::vector<std::uint64_t>>(reply.at("fileids"), "uploadfile");

    assignMetadata(result, sent, metadata, fileIds);

    LogRegistry::upload()->debug("[UploadBuilder] {} file(s) into {}: {} uploaded, {} renamed, {} conflict, {} failed",
                                 plan.files.size(), plan.folder.toString(),
                                 result.count(UploadStatus::Uploaded), result.count(UploadStatus::Renamed),
                                 result.count(UploadStatus::Conflict), result.count(UploadStatus::Failed));
    return result;
}

}

std::string_view pcloud::builders::toString(const UploadStatus s) {
    switch (s) {
        case UploadStatus::Uploaded: return "uploaded";
        case UploadStatus::Renamed: return "renamed";
        case UploadStatus::Conflict: return "conflict";
        case UploadStatus::Failed: return "failed";
    }
    return "failed";
}

const UploadOutcome* UploadResult::find(const std::string& name) const {
    const auto it = std::ranges::find(outcomes, name, &UploadOutcome::name);
    return it == outcomes.end() ? nullptr : &*it;
}

std::size_t UploadResult::count(const UploadStatus status) const {
    return static_cast<std::size_t>(std::ranges::count(outcomes, status, &UploadOutcome::status));
}

bool UploadResult::allStored() const {
    return std::ranges::all_of(outcomes, [](const UploadOutcome& o) {
        return o.status == UploadStatus::Uploaded || o.status == UploadStatus::Renamed;
    });
}

UploadBuilder::UploadBuilder(Client client, Identifier folder)
    : client_(std::move(client)), folder_(std::move(folder)) {}

void UploadBuilder::ensureMutable() const {
    if (executed_) throw std::logic_error("UploadBuilder already executed");
}

UploadBuilder& UploadBuilder::withFile(std::string name, http::Payload payload) {
    ensureMutable();
    if (name.empty() || name.find('/') != std::string::npos)
        throw errors::ConfigurationError(fmt::format("Invalid upload file name '{}'", name));
    files_.push_back({std::move(name), std::move(payload)});
    return *this;
}

UploadBuilder& UploadBuilder::renameIfExists(const bool value) {
    ensureMutable();
    renameIfExists_ = value;
    return *this;
}

UploadBuilder& UploadBuilder::noPartial(const bool value) {
    ensureMutable();
    noPartial_ = value;
    return *this;
}

UploadBuilder& UploadBuilder::mtime(const std::time_t value) {
    ensureMutable();
    mtime_ = value;
    return *this;
}

UploadBuilder& UploadBuilder::ctime(const std::time_t value) {
    ensureMutable();
    ctime_ = value;
    return *this;
}

std::future<UploadResult> UploadBuilder::upload() {
    ensureMutable();
    executed_ = true;

    if (files_.empty()) {
        std::promise<UploadResult> done;
        done.set_value({});
        return done.get_future();
    }

    UploadPlan plan{folder_, std::move(files_), renameIfExists_, noPartial_, mtime_, ctime_};
    files_.clear();
    return client_.dispatch([plan = std::move(plan)](const Client& c) { return runUpload(c, plan); });
}
