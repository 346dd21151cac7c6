#pragma once

#include "pcloud/client/Client.hpp"

#include <chrono>
#include <ctime>
#include <functional>
#include <stop_token>

namespace pcloud::builders {

class CopyFileBuilder {
public:
    CopyFileBuilder(client::Client client, types::Identifier file, types::Identifier target);

    // When false an existing file of the same name makes the copy fail.
    CopyFileBuilder& overwrite(bool value) { overwrite_ = value; return *this; }
    CopyFileBuilder& mtime(std::time_t value) { mtime_ = value; return *this; }
    // Only honoured together with mtime.
    CopyFileBuilder& ctime(std::time_t value) { ctime_ = value; return *this; }
    CopyFileBuilder& withNewName(std::string name) { newName_ = std::move(name); return *this; }
    CopyFileBuilder& withRevision(std::uint64_t revision) { revision_ = revision; return *this; }

    [[nodiscard]] http::Request request() const;
    std::future<types::FileOrFolderStat> execute() const;

private:
    client::Client client_;
    types::Identifier file_, target_;
    bool overwrite_ = true;
    std::optional<std::time_t> mtime_, ctime_;
    std::optional<std::string> newName_;
    std::optional<std::uint64_t> revision_;
};

class MoveFileBuilder {
public:
    MoveFileBuilder(client::Client client, types::Identifier file, types::Identifier target);

    MoveFileBuilder& withNewName(std::string name) { newName_ = std::move(name); return *this; }
    MoveFileBuilder& withRevision(std::uint64_t revision) { revision_ = revision; return *this; }

    [[nodiscard]] http::Request request() const;
    std::future<types::FileOrFolderStat> execute() const;

private:
    client::Client client_;
    types::Identifier file_, target_;
    std::optional<std::string> newName_;
    std::optional<std::uint64_t> revision_;
};

class ChecksumFileBuilder {
public:
    ChecksumFileBuilder(client::Client client, types::Identifier file);

    ChecksumFileBuilder& withRevision(std::uint64_t revision) { revision_ = revision; return *this; }

    [[nodiscard]] http::Request request() const;
    std::future<types::FileChecksums> get() const;

    // Fetches the server checksums and validates them against locally computed ones.
    std::future<types::FileChecksums> verify(checksum::ChecksumSet computed) const;

private:
    client::Client client_;
    types::Identifier file_;
    std::optional<std::uint64_t> revision_;
};

class DownloadLinkBuilder {
public:
    DownloadLinkBuilder(client::Client client, types::Identifier file);

    DownloadLinkBuilder& withRevision(std::uint64_t revision) { revision_ = revision; return *this; }

    [[nodiscard]] http::Request request() const;
    std::future<types::DownloadLink> get() const;

    // Resolves the link and fetches the content in one task.
    std::future<http::Response> download() const;

private:
    client::Client client_;
    types::Identifier file_;
    std::optional<std::uint64_t> revision_;
};

class PublicLinkBuilder {
public:
    PublicLinkBuilder(client::Client client, types::Identifier file);

    PublicLinkBuilder& expireAfter(std::time_t when) { expire_ = when; return *this; }
    PublicLinkBuilder& maxDownloads(std::uint64_t value) { maxDownloads_ = value; return *this; }
    PublicLinkBuilder& maxTraffic(std::uint64_t bytes) { maxTraffic_ = bytes; return *this; }
    PublicLinkBuilder& shortLink(bool value = true) { shortLink_ = value; return *this; }
    PublicLinkBuilder& password(std::string value) { password_ = std::move(value); return *this; }
    PublicLinkBuilder& withRevision(std::uint64_t revision) { revision_ = revision; return *this; }

    [[nodiscard]] http::Request request() const;
    std::future<types::PublicFileLink> get() const;

private:
    client::Client client_;
    types::Identifier file_;
    std::optional<std::time_t> expire_;
    std::optional<std::uint64_t> maxDownloads_, maxTraffic_, revision_;
    bool shortLink_ = false;
    std::optional<std::string> password_;
};

class DiffBuilder {
public:
    explicit DiffBuilder(client::Client client);

    DiffBuilder& afterDiffId(std::uint64_t id) { diffId_ = id; return *this; }
    DiffBuilder& after(std::time_t when) { after_ = when; return *this; }
    DiffBuilder& onlyLast(std::uint64_t count) { last_ = count; return *this; }
    DiffBuilder& limit(std::uint64_t count) { limit_ = count; return *this; }
    // Long-poll until an event arrives; only sent together with afterDiffId.
    DiffBuilder& block(bool value = true) { block_ = value; return *this; }
    DiffBuilder& blockTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; return *this; }

    [[nodiscard]] http::Request request() const;
    std::future<types::Diff> get() const;

    using EntryHandler = std::function<void(const types::DiffEntry&)>;
    using EntryFilter = std::function<bool(const types::DiffEntry&)>;

    /**
     * Follows the event log until stop is requested. Each round long-polls diff
     * with block=1 from the last diffid seen, so entries at or below it are
     * dropped. Timed-out polls are retried; any other error ends the stream
     * and is rethrown through the future. Entries rejected by filter are
     * skipped but still advance the position. The stream holds one pool worker
     * while it runs; the future yields the last diffid reached.
     */
    std::future<std::uint64_t> stream(std::stop_token stop, EntryHandler onEntry, EntryFilter filter = {}) const;

private:
    client::Client client_;
    std::optional<std::uint64_t> diffId_, last_, limit_;
    std::optional<std::time_t> after_;
    bool block_ = false;
    std::optional<std::chrono::milliseconds> timeout_;
};

}
