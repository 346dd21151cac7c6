#include "pcloud/auth/Credentials.hpp"
#include "pcloud/errors/Errors.hpp"

using namespace pcloud::auth;

Credentials Credentials::fromOAuth(std::string token) {
    return Credentials(OAuthToken{std::move(token)});
}

Credentials Credentials::fromSession(std::shared_ptr<const Session> session) {
    if (!session) throw errors::ConfigurationError("Session must not be null");
    return Credentials(std::move(session));
}

void Credentials::attach(http::Request& req) const {
    if (const auto* oauth = std::get_if<OAuthToken>(&value_)) {
        req.header("Authorization: Bearer " + oauth->token);
        return;
    }
    req.param("auth", std::get<std::shared_ptr<const Session>>(value_)->token());
}

std::shared_ptr<const Session> Credentials::session() const {
    if (isOAuth()) return nullptr;
    return std::get<std::shared_ptr<const Session>>(value_);
}

long Credentials::shareCount() const {
    if (isOAuth()) return 0;
    return std::get<std::shared_ptr<const Session>>(value_).use_count();
}
