#include "pcloud/auth/Session.hpp"
#include "pcloud/concurrency/ThreadPoolManager.hpp"
#include "pcloud/errors/Errors.hpp"
#include "pcloud/logging/LogRegistry.hpp"
#include "pcloud/types/Result.hpp"

#include <nlohmann/json.hpp>

using namespace pcloud::auth;
using namespace pcloud::errors;
using namespace pcloud::logging;
using namespace pcloud::concurrency;

std::shared_ptr<const Session> Session::login(const std::string& host,
                                              const std::string& username,
                                              const std::string& password,
                                              std::shared_ptr<http::Transport> transport) {
    http::Request req;
    req.method = http::Method::Post;
    req.url = host + "/userinfo";
    req.param("getauth", "1");
    req.field("username", username);
    req.field("password", password);

    const auto res = transport->perform(req);

    const auto body = nlohmann::json::parse(res.body, nullptr, false);
    if (body.is_discarded() || !body.is_object())
        throw AuthenticationError(static_cast<int>(res.status), "login reply is not JSON");

    if (!body.contains("result") || !body["result"].is_number_integer())
        throw AuthenticationError(-1, "malformed userinfo reply: no integer result code");

    const int code = body["result"].get<int>();
    if (code != 0) {
        const auto reason = body.contains("error") && body["error"].is_string()
                                ? body["error"].get<std::string>()
                                : std::string(types::describe(code));
        LogRegistry::auth()->warn("[Session] Login rejected by {} ({}): {}", host, code, reason);
        throw AuthenticationError(code, reason);
    }

    if (!body.contains("auth") || !body["auth"].is_string() || body["auth"].get<std::string>().empty())
        throw AuthenticationError(code, "login reply carries no session token");

    LogRegistry::auth()->debug("[Session] Logged in at {}", host);
    return std::make_shared<const Session>(body["auth"].get<std::string>(), host, std::move(transport));
}

Session::Session(std::string token, std::string host, std::shared_ptr<http::Transport> transport)
    : token_(std::move(token)), host_(std::move(host)), transport_(std::move(transport)) {}

Session::~Session() {
    auto doLogout = [host = host_, token = token_, transport = transport_] {
        try {
            if (!logout(host, token, *transport))
                LogRegistry::auth()->warn("[Session] Logout at {} was not confirmed", host);
        } catch (const std::exception& e) {
            LogRegistry::auth()->warn("[Session] Logout at {} failed: {}", host, e.what());
        }
    };

    try {
        const auto pool = ThreadPoolManager::instance().httpPool();
        if (pool && pool->submit(std::make_shared<FireAndForgetTask>(doLogout))) return;
    } catch (const std::exception& e) {
        LogRegistry::auth()->warn("[Session] Worker pool unavailable, logging out inline: {}", e.what());
    }
    doLogout();
}

bool Session::logout(const std::string& host, const std::string& token, http::Transport& transport) {
    http::Request req;
    req.url = host + "/logout";
    req.param("auth", token);

    const auto reply = transport.perform(req).json();
    types::ensureOk(reply, "Session::logout");
    return reply.value("auth_deleted", false);
}
