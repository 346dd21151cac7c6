#include <gtest/gtest.h>
#include "FakePCloud.hpp"

#include "pcloud/auth/Credentials.hpp"
#include "pcloud/auth/Session.hpp"
#include "pcloud/client/Client.hpp"
#include "pcloud/concurrency/ThreadPoolManager.hpp"
#include "pcloud/config/ConfigRegistry.hpp"
#include "pcloud/errors/Errors.hpp"

#include <cstdlib>
#include <thread>
#include <vector>

using namespace pcloud;
using namespace pcloud::test;

class SessionTest : public ::testing::Test {
protected:
    static constexpr auto HOST = "https://eapi.pcloud.com";
    FakePCloud cloud;

    static void drainPool() {
        if (const auto pool = concurrency::ThreadPoolManager::instance().httpPool()) pool->waitIdle();
    }

    client::Client login() {
        return client::Client::withUsernameAndPassword(HOST, "user@example.com", "secret", cloud.transport).get();
    }

    void TearDown() override { drainPool(); }
};

TEST_F(SessionTest, LoginSendsCredentialsAsFormFields) {
    const auto session = auth::Session::login(HOST, "user@example.com", "secret", cloud.transport);
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->token(), "tok-1");
    EXPECT_EQ(session->host(), HOST);

    const auto reqs = cloud.transport->requests("userinfo");
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, http::Method::Post);
    EXPECT_EQ(reqs[0].find("getauth"), "1");
    for (const auto& [name, value] : reqs[0].query) EXPECT_NE(name, "password");
    EXPECT_EQ(reqs[0].find("password"), "secret");
}

TEST_F(SessionTest, RejectedLoginThrowsAuthenticationError) {
    try {
        (void)auth::Session::login(HOST, "user@example.com", "wrong", cloud.transport);
        FAIL() << "expected AuthenticationError";
    } catch (const errors::AuthenticationError& e) {
        EXPECT_EQ(e.code(), 2000);
        EXPECT_EQ(e.reason(), "Log in failed.");
    }
}

TEST_F(SessionTest, NonJsonLoginReplyIsAnAuthenticationError) {
    cloud.transport->on("userinfo", [](const http::Request&) {
        return http::Response{502, "<html>bad gateway</html>", "HTTP/1.1 502 Bad Gateway\r\n\r\n"};
    });
    EXPECT_THROW((void)auth::Session::login(HOST, "u", "p", cloud.transport), errors::AuthenticationError);
}

TEST_F(SessionTest, LoginReplyWithoutIntegerResultIsAnAuthenticationError) {
    cloud.transport->on("userinfo", [](const http::Request&) {
        return FakeTransport::reply({{"result", "ok"}, {"auth", "tok"}});
    });
    try {
        (void)auth::Session::login(HOST, "user@example.com", "secret", cloud.transport);
        FAIL() << "expected AuthenticationError";
    } catch (const errors::AuthenticationError& e) {
        EXPECT_EQ(e.code(), -1);
    }
}

TEST_F(SessionTest, RejectionWithNonStringErrorFallsBackToDescription) {
    cloud.transport->on("userinfo", [](const http::Request&) {
        return FakeTransport::reply({{"result", 2000}, {"error", 17}});
    });
    try {
        (void)auth::Session::login(HOST, "user@example.com", "secret", cloud.transport);
        FAIL() << "expected AuthenticationError";
    } catch (const errors::AuthenticationError& e) {
        EXPECT_EQ(e.code(), 2000);
        EXPECT_EQ(e.reason(), "Log in failed");
    }
}

TEST_F(SessionTest, LastReleaseLogsOutExactlyOnce) {
    {
        auto client = login();
        std::vector<client::Client> clones(5, client);
        EXPECT_EQ(client.credentials().shareCount(), 6);

        clones.erase(clones.begin() + 2);
        clones.pop_back();
        drainPool();
        EXPECT_TRUE(cloud.loggedOut().empty());
    }
    drainPool();

    ASSERT_EQ(cloud.loggedOut().size(), 1u);
    EXPECT_EQ(cloud.loggedOut().front(), "tok-1");
    EXPECT_EQ(cloud.liveSessions(), 0u);
    EXPECT_EQ(cloud.transport->count("logout"), 1u);
}

TEST_F(SessionTest, ConcurrentReleaseLogsOutOnce) {
    {
        std::vector<std::thread> threads;
        {
            const auto client = login();
            for (int i = 0; i < 8; ++i)
                threads.emplace_back([copy = client] {
                    auto local = copy;
                    (void)local.apiHost();
                });
        }
        for (auto& t : threads) t.join();
    }
    drainPool();

    EXPECT_EQ(cloud.loggedOut().size(), 1u);
    EXPECT_EQ(cloud.transport->count("logout"), 1u);
}

TEST_F(SessionTest, LogoutGoesToTheLoginHost) {
    cloud.setNearestServer("api7.pcloud.com");
    {
        const auto client = login();
        EXPECT_EQ(client.apiHost(), "https://api7.pcloud.com");
    }
    drainPool();

    const auto reqs = cloud.transport->requests("logout");
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].url, std::string(HOST) + "/logout");
}

TEST_F(SessionTest, FailedLogoutIsOnlyLogged) {
    {
        const auto client = login();
        cloud.transport->failAll();
    }
    drainPool();
    EXPECT_EQ(cloud.transport->count("logout"), 1u);
    EXPECT_EQ(cloud.liveSessions(), 1u);
}

TEST_F(SessionTest, OAuthNeverLogsOut) {
    {
        const auto client = client::Client::withOAuth(HOST, "oauth-token", cloud.transport);
        auto copy = client;
        EXPECT_TRUE(copy.credentials().isOAuth());
        EXPECT_EQ(copy.credentials().shareCount(), 0);
    }
    drainPool();
    EXPECT_EQ(cloud.transport->total(), 0u);
}

TEST(CredentialsTest, OAuthAttachesBearerHeader) {
    http::Request req;
    auth::Credentials::fromOAuth("abc").attach(req);
    ASSERT_EQ(req.headers.size(), 1u);
    EXPECT_EQ(req.headers[0], "Authorization: Bearer abc");
    EXPECT_FALSE(req.has("auth"));
}

TEST(CredentialsTest, NullSessionIsRejected) {
    EXPECT_THROW((void)auth::Credentials::fromSession(nullptr), errors::ConfigurationError);
}

// Runs in a fresh process so the worker pool has not been created yet.
TEST(SessionDeathTest, ReleaseWithUnloadableConfigLogsOutInline) {
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    EXPECT_EXIT({
        FakePCloud cloud;
        auto session = auth::Session::login("https://eapi.pcloud.com", "user@example.com", "secret", cloud.transport);

        ::setenv("PCLOUD_CONFIG", "/nonexistent/pcloud.yaml", 1);
        config::ConfigRegistry::reset();

        session.reset();

        std::exit(cloud.loggedOut().size() == 1 ? 0 : 1);
    }, ::testing::ExitedWithCode(0), "");
}
