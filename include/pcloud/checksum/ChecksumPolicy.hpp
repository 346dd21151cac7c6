#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>

namespace pcloud::checksum {

// Algorithm name (md5, sha1, sha256) -> lowercase hex digest.
using ChecksumSet = std::map<std::string, std::string>;

enum class Region { International, Europe, Unknown };

[[nodiscard]] std::string_view toString(Region r);

// Explicit table keyed by API endpoint; anything not listed is Region::Unknown.
[[nodiscard]] Region regionForHost(std::string_view host);

/**
 * Algorithms checksumfile is guaranteed to return for files stored in a region:
 * sha1 everywhere, md5 on the international (US) servers, sha256 on the European ones.
 */
[[nodiscard]] std::set<std::string> guaranteedAlgorithms(Region region);

/**
 * Compares the algorithms both sets carry. Succeeds when at least one is shared
 * and all shared ones agree; throws errors::IntegrityError otherwise. Names and
 * digests are compared case-insensitively.
 */
void validateChecksum(const ChecksumSet& expected, const ChecksumSet& computed);

// Digests of in-memory content; unknown names throw errors::ConfigurationError.
[[nodiscard]] ChecksumSet computeChecksums(std::string_view data, const std::set<std::string>& algorithms);

}
