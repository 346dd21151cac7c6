#pragma once

#include "pcloud/http/Transport.hpp"

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace pcloud::config { struct TransportConfig; }

namespace pcloud::http {

struct CurlOptions {
    std::chrono::seconds connectTimeout{30};
    std::chrono::seconds requestTimeout{0};   // 0 = unlimited
    std::string userAgent = "pcloud-cpp/0.1";
    bool verifyTls = true;
    bool followRedirects = true;

    static CurlOptions fromConfig(const config::TransportConfig& cfg);
};

class CurlTransport final : public Transport {
public:
    CurlTransport();
    explicit CurlTransport(CurlOptions opts);

    Response perform(const Request& req) override;

    // Aborts every transfer started before this call.
    void cancelPending();

    [[nodiscard]] const CurlOptions& options() const { return opts_; }

private:
    std::string buildUrl(CURL* h, const Request& req) const;
    static std::string encodePairs(CURL* h, const std::vector<Param>& params);

    CurlOptions opts_;
    std::atomic<std::uint64_t> generation_{0};
};

}
