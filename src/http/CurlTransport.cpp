#include "pcloud/http/CurlTransport.hpp"
#include "pcloud/http/curlWrappers.hpp"
#include "pcloud/config/Config.hpp"
#include "pcloud/errors/Errors.hpp"
#include "pcloud/logging/LogRegistry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <istream>
#include <memory>
#include <mutex>

using namespace pcloud::http;
using namespace pcloud::errors;
using namespace pcloud::logging;

namespace pcloud::http {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

}

namespace {

const char* methodName(const Method m) { return m == Method::Post ? "POST" : "GET"; }

struct ProgressState {
    const std::atomic<std::uint64_t>* generation;
    std::uint64_t startedAt;
};

int onProgress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* st = static_cast<ProgressState*>(clientp);
    return st->generation->load() != st->startedAt ? 1 : 0;
}

size_t readFromStream(char* buffer, const size_t size, const size_t nitems, void* arg) {
    auto* in = static_cast<std::istream*>(arg);
    in->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (in->bad()) return CURL_READFUNC_ABORT;
    return static_cast<size_t>(in->gcount());
}

}

CurlOptions CurlOptions::fromConfig(const config::TransportConfig& cfg) {
    CurlOptions o;
    o.connectTimeout = std::chrono::seconds(cfg.connect_timeout_seconds);
    o.requestTimeout = std::chrono::seconds(cfg.request_timeout_seconds);
    o.userAgent = cfg.user_agent;
    o.verifyTls = cfg.verify_tls;
    o.followRedirects = cfg.follow_redirects;
    return o;
}

CurlTransport::CurlTransport() : CurlTransport(CurlOptions{}) {}

CurlTransport::CurlTransport(CurlOptions opts) : opts_(std::move(opts)) {
    ensureCurlGlobalInit();
}

void CurlTransport::cancelPending() {
    generation_.fetch_add(1);
    LogRegistry::transport()->debug("[CurlTransport] Cancelling in-flight transfers");
}

std::string CurlTransport::encodePairs(CURL* h, const std::vector<Param>& params) {
    std::string out;
    for (const auto& [name, value] : params) {
        char* k = curl_easy_escape(h, name.c_str(), static_cast<int>(name.size()));
        char* v = curl_easy_escape(h, value.c_str(), static_cast<int>(value.size()));
        if (!k || !v) {
            curl_free(k);
            curl_free(v);
            throw TransportError("curl_easy_escape failed");
        }
        if (!out.empty()) out += '&';
        out += k;
        out += '=';
        out += v;
        curl_free(k);
        curl_free(v);
    }
    return out;
}

std::string CurlTransport::buildUrl(CURL* h, const Request& req) const {
    if (req.query.empty()) return req.url;
    const char sep = req.url.find('?') == std::string::npos ? '?' : '&';
    return req.url + sep + encodePairs(h, req.query);
}

Response CurlTransport::perform(const Request& req) {
    const auto method = req.apiMethod();
    ProgressState progress{&generation_, generation_.load()};

    SList headers;
    for (const auto& h : req.headers) headers.add(h);

    std::string url, postFields;
    std::unique_ptr<Mime> mime;

    auto res = performCurl([&](CURL* h) {
        url = buildUrl(h, req);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_USERAGENT, opts_.userAgent.c_str());
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, opts_.followRedirects ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, opts_.verifyTls ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, opts_.verifyTls ? 2L : 0L);
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(
            std::chrono::duration_cast<std::chrono::milliseconds>(opts_.connectTimeout).count()));

        auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(opts_.requestTimeout);
        if (req.timeout && (timeout.count() == 0 || *req.timeout < timeout)) timeout = *req.timeout;
        if (timeout.count() > 0) curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));

        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, onProgress);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &progress);

        if (headers.get()) curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());

        if (req.method == Method::Get) {
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
            return;
        }

        if (req.files.empty()) {
            postFields = encodePairs(h, req.form);
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(postFields.size()));
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, postFields.c_str());
            return;
        }

        mime = std::make_unique<Mime>(h);
        for (const auto& [name, value] : req.form) {
            auto* part = mime->addPart();
            curl_mime_name(part, name.c_str());
            curl_mime_data(part, value.c_str(), value.size());
        }

        for (const auto& f : req.files) {
            auto* part = mime->addPart();
            curl_mime_name(part, "file");
            if (f.payload.isBytes()) {
                curl_mime_data(part, f.payload.bytes().data(), f.payload.bytes().size());
            } else if (f.payload.isFile()) {
                if (curl_mime_filedata(part, f.payload.file().c_str()) != CURLE_OK)
                    throw TransportError(fmt::format("Cannot read upload source {}", f.payload.file().string()));
            } else {
                const auto size = f.payload.size();
                curl_mime_data_cb(part, size ? static_cast<curl_off_t>(*size) : -1,
                                  readFromStream, nullptr, nullptr, f.payload.stream().get());
            }
            curl_mime_filename(part, f.filename.c_str());
            curl_mime_type(part, "application/octet-stream");
        }
        curl_easy_setopt(h, CURLOPT_MIMEPOST, mime->get());
    });

    if (!res.ok()) {
        const bool timedOut = res.curl == CURLE_OPERATION_TIMEDOUT;
        const bool cancelled = res.curl == CURLE_ABORTED_BY_CALLBACK;
        LogRegistry::transport()->error("[CurlTransport] {} {} failed: {}",
                                        methodName(req.method), method, res.error);
        throw TransportError(fmt::format("{} {} failed: {}", methodName(req.method), method, res.error),
                             timedOut, cancelled);
    }

    LogRegistry::transport()->debug("[CurlTransport] {} {} -> HTTP {} ({} bytes)",
                                    methodName(req.method), method, res.http, res.body.size());

    return {res.http, std::move(res.body), std::move(res.hdr)};
}
