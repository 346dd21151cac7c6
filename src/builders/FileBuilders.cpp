#include "pcloud/builders/FileBuilders.hpp"
#include "pcloud/errors/Errors.hpp"
#include "pcloud/logging/LogRegistry.hpp"
#include "pcloud/util/timestamp.hpp"

using namespace pcloud::builders;
using namespace pcloud::client;
using namespace pcloud::types;
using namespace pcloud::logging;
using pcloud::http::Method;
using pcloud::http::Request;
using pcloud::http::Response;

CopyFileBuilder::CopyFileBuilder(Client client, Identifier file, Identifier target)
    : client_(std::move(client)), file_(std::move(file)), target_(std::move(target)) {}

Request CopyFileBuilder::request() const {
    auto req = client_.newRequest(Method::Get, "copyfile");
    req.param(file_.param(EntityKind::File));
    req.param(target_.targetParam());
    if (mtime_) req.param("mtime", std::to_string(*mtime_));
    if (mtime_ && ctime_) req.param("ctime", std::to_string(*ctime_));
    if (newName_) req.param("toname", *newName_);
    if (revision_) req.param("revisionid", std::to_string(*revision_));
    if (!overwrite_) req.param("noover", "1");
    return req;
}

std::future<FileOrFolderStat> CopyFileBuilder::execute() const {
    return client_.dispatch([req = request()](const Client& c) {
        return c.executeAs<FileOrFolderStat>(req);
    });
}

MoveFileBuilder::MoveFileBuilder(Client client, Identifier file, Identifier target)
    : client_(std::move(client)), file_(std::move(file)), target_(std::move(target)) {}

Request MoveFileBuilder::request() const {
    auto req = client_.newRequest(Method::Get, "renamefile");
    req.param(file_.param(EntityKind::File));
    req.param(target_.targetParam());
    if (newName_) req.param("toname", *newName_);
    if (revision_) req.param("revisionid", std::to_string(*revision_));
    return req;
}

std::future<FileOrFolderStat> MoveFileBuilder::execute() const {
    return client_.dispatch([req = request()](const Client& c) {
        return c.executeAs<FileOrFolderStat>(req);
    });
}

ChecksumFileBuilder::ChecksumFileBuilder(Client client, Identifier file)
    : client_(std::move(client)), file_(std::move(file)) {}

Request ChecksumFileBuilder::request() const {
    auto req = client_.newRequest(Method::Get, "checksumfile");
    req.param(file_.param(EntityKind::File));
    if (revision_) req.param("revisionid", std::to_string(*revision_));
    return req;
}

std::future<FileChecksums> ChecksumFileBuilder::get() const {
    return client_.dispatch([req = request()](const Client& c) {
        return c.executeAs<FileChecksums>(req);
    });
}

std::future<FileChecksums> ChecksumFileBuilder::verify(checksum::ChecksumSet computed) const {
    return client_.dispatch([req = request(), computed = std::move(computed)](const Client& c) {
        auto sums = c.executeAs<FileChecksums>(req);
        const auto expected = sums.toChecksumSet();

        for (const auto& alg : checksum::guaranteedAlgorithms(c.region()))
            if (!expected.contains(alg))
                LogRegistry::checksum()->warn("[ChecksumFileBuilder] {} region reply lacks guaranteed {}",
                                              checksum::toString(c.region()), alg);

        checksum::validateChecksum(expected, computed);
        return sums;
    });
}

DownloadLinkBuilder::DownloadLinkBuilder(Client client, Identifier file)
    : client_(std::move(client)), file_(std::move(file)) {}

Request DownloadLinkBuilder::request() const {
    auto req = client_.newRequest(Method::Get, "getfilelink");
    req.param(file_.param(EntityKind::File));
    if (revision_) req.param("revisionid", std::to_string(*revision_));
    return req;
}

std::future<DownloadLink> DownloadLinkBuilder::get() const {
    return client_.dispatch([req = request()](const Client& c) {
        return c.executeAs<DownloadLink>(req);
    });
}

std::future<Response> DownloadLinkBuilder::download() const {
    return client_.dispatch([req = request()](const Client& c) {
        return c.fetchContent(c.executeAs<DownloadLink>(req));
    });
}

PublicLinkBuilder::PublicLinkBuilder(Client client, Identifier file)
    : client_(std::move(client)), file_(std::move(file)) {}

Request PublicLinkBuilder::request() const {
    auto req = client_.newRequest(Method::Get, "getfilepublink");
    req.param(file_.param(EntityKind::File));
    if (maxDownloads_) req.param("maxdownloads", std::to_string(*maxDownloads_));
    if (password_) req.param("linkpassword", *password_);
    if (maxTraffic_) req.param("maxtraffic", std::to_string(*maxTraffic_));
    if (shortLink_) req.param("shortlink", "1");
    if (expire_) req.param("expire", util::formatPCloudTimestamp(*expire_));
    if (revision_) req.param("revisionid", std::to_string(*revision_));
    return req;
}

std::future<PublicFileLink> PublicLinkBuilder::get() const {
    return client_.dispatch([req = request()](const Client& c) {
        return c.executeAs<PublicFileLink>(req);
    });
}

DiffBuilder::DiffBuilder(Client client) : client_(std::move(client)) {}

Request DiffBuilder::request() const {
    auto req = client_.newRequest(Method::Get, "diff");
    if (diffId_) req.param("diffid", std::to_string(*diffId_));
    if (after_) req.param("after", util::formatPCloudTimestamp(*after_));
    if (last_) req.param("last", std::to_string(*last_));
    if (limit_) req.param("limit", std::to_string(*limit_));
    if (block_ && diffId_) req.param("block", "1");
    req.timeout = timeout_;
    return req;
}

std::future<Diff> DiffBuilder::get() const {
    return client_.dispatch([req = request()](const Client& c) {
        return c.executeAs<Diff>(req);
    });
}

std::future<std::uint64_t> DiffBuilder::stream(std::stop_token stop, EntryHandler onEntry, EntryFilter filter) const {
    if (!onEntry) throw errors::ConfigurationError("Diff stream needs an entry handler");

    return client_.dispatch([self = *this, stop = std::move(stop), onEntry = std::move(onEntry),
                             filter = std::move(filter)](const Client& c) {
        auto position = self.diffId_;

        while (!stop.stop_requested()) {
            DiffBuilder round(self);
            round.block_ = true;
            round.diffId_ = position;
            if (position) round.after_.reset();

            Diff diff;
            try {
                diff = c.executeAs<Diff>(round.request());
            } catch (const errors::TransportError& e) {
                if (!e.timedOut()) throw;
                LogRegistry::client()->debug("[DiffBuilder] Poll timed out, polling again");
                continue;
            }

            if (diff.entries.empty()) {
                if (!position && diff.diffid) position = diff.diffid;
                continue;
            }
            LogRegistry::client()->debug("[DiffBuilder] Received {} event(s)", diff.entries.size());

            bool interrupted = false;
            for (const auto& entry : diff.entries) {
                if (stop.stop_requested()) {
                    interrupted = true;
                    break;
                }
                if (position && entry.diffid <= *position) continue;
                if (!filter || filter(entry)) onEntry(entry);
                position = entry.diffid;
            }
            if (!interrupted && (!position || diff.diffid > *position)) position = diff.diffid;
        }

        return position.value_or(0);
    });
}
