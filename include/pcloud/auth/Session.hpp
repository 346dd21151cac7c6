#pragma once

#include "pcloud/http/Transport.hpp"

#include <memory>
#include <string>

namespace pcloud::auth {

/**
 * Server-issued session token obtained through a username/password login.
 *
 * A Session is only ever handed out as std::shared_ptr<const Session>; every
 * client copy shares it, and the destructor of the last owner invalidates the
 * token on the server. The logout is best effort: it is queued on the worker
 * pool (or run inline once the pool is gone) and failures are only logged.
 */
class Session {
public:
    // Throws errors::AuthenticationError on rejection, errors::TransportError if the server is unreachable.
    static std::shared_ptr<const Session> login(const std::string& host,
                                                const std::string& username,
                                                const std::string& password,
                                                std::shared_ptr<http::Transport> transport);

    Session(std::string token, std::string host, std::shared_ptr<http::Transport> transport);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& token() const { return token_; }
    [[nodiscard]] const std::string& host() const { return host_; }

    // Sends the logout request synchronously. Returns whether the server confirmed it.
    static bool logout(const std::string& host, const std::string& token, http::Transport& transport);

private:
    std::string token_;
    std::string host_;
    std::shared_ptr<http::Transport> transport_;
};

}
