#pragma once

#include "pcloud/auth/Session.hpp"
#include "pcloud/http/Request.hpp"

#include <memory>
#include <string>
#include <variant>

namespace pcloud::auth {

struct OAuthToken {
    std::string token;
};

// Either a caller-owned OAuth2 token or a shared login session. Copying shares the session.
class Credentials {
public:
    static Credentials fromOAuth(std::string token);
    static Credentials fromSession(std::shared_ptr<const Session> session);

    [[nodiscard]] bool isOAuth() const { return std::holds_alternative<OAuthToken>(value_); }
    [[nodiscard]] bool isSession() const { return !isOAuth(); }

    // Adds "Authorization: Bearer ..." or the "auth" query parameter.
    void attach(http::Request& req) const;

    [[nodiscard]] std::shared_ptr<const Session> session() const;

    // Number of live handles sharing the session; 0 for OAuth credentials.
    [[nodiscard]] long shareCount() const;

private:
    explicit Credentials(std::variant<OAuthToken, std::shared_ptr<const Session>> v) : value_(std::move(v)) {}

    std::variant<OAuthToken, std::shared_ptr<const Session>> value_;
};

}
