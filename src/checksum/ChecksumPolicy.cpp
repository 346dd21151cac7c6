#include "pcloud/checksum/ChecksumPolicy.hpp"
#include "pcloud/errors/Errors.hpp"
#include "pcloud/logging/LogRegistry.hpp"

#include <openssl/evp.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>
#include <unordered_map>

using namespace pcloud::errors;
using namespace pcloud::logging;

namespace pcloud::checksum {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string stripTrailingSlash(std::string_view host) {
    while (!host.empty() && host.back() == '/') host.remove_suffix(1);
    return lower(host);
}

const EVP_MD* digestFor(const std::string& name) {
    if (name == "md5") return EVP_md5();
    if (name == "sha1") return EVP_sha1();
    if (name == "sha256") return EVP_sha256();
    return nullptr;
}

std::string hexDigest(const EVP_MD* md, const std::string_view data) {
    const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1)
        throw std::runtime_error("EVP digest computation failed");

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return oss.str();
}

}

std::string_view toString(const Region r) {
    switch (r) {
        case Region::International: return "international";
        case Region::Europe: return "europe";
        case Region::Unknown: return "unknown";
    }
    return "unknown";
}

Region regionForHost(const std::string_view host) {
    static const std::unordered_map<std::string, Region> table = {
        {"https://api.pcloud.com", Region::International},
        {"https://eapi.pcloud.com", Region::Europe},
    };
    const auto it = table.find(stripTrailingSlash(host));
    return it == table.end() ? Region::Unknown : it->second;
}

std::set<std::string> guaranteedAlgorithms(const Region region) {
    switch (region) {
        case Region::International: return {"sha1", "md5"};
        case Region::Europe: return {"sha1", "sha256"};
        case Region::Unknown: break;
    }
    return {"sha1"};
}

void validateChecksum(const ChecksumSet& expected, const ChecksumSet& computed) {
    ChecksumSet comp;
    for (const auto& [alg, digest] : computed) comp[lower(alg)] = lower(digest);

    unsigned int compared = 0;
    for (const auto& [alg, digest] : expected) {
        const auto it = comp.find(lower(alg));
        if (it == comp.end()) continue;
        ++compared;
        if (lower(digest) != it->second) {
            LogRegistry::checksum()->warn("[ChecksumPolicy] {} mismatch: expected {}, computed {}",
                                          it->first, lower(digest), it->second);
            throw IntegrityError(it->first, lower(digest), it->second);
        }
    }

    if (compared == 0)
        throw IntegrityError("no checksum algorithm in common between expected and computed sets");
}

ChecksumSet computeChecksums(const std::string_view data, const std::set<std::string>& algorithms) {
    ChecksumSet out;
    for (const auto& alg : algorithms) {
        const auto name = lower(alg);
        const auto* md = digestFor(name);
        if (!md) throw ConfigurationError(fmt::format("Unsupported checksum algorithm: {}", alg));
        out[name] = hexDigest(md, data);
    }
    return out;
}

}
