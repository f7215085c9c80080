#include <gtest/gtest.h>
#include <sftp/slate_session.hpp>
#include "fake_backend.hpp"
#include <stdexcept>

namespace fs = std::filesystem;

class SessionTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeRemote> remote = std::make_shared<FakeRemote>();

    std::unique_ptr<SlateSession> make_session(ConnectionConfig config = fake_connection_config()) {
        return std::make_unique<SlateSession>(config, std::make_unique<FakeBackend>(remote));
    }
};

TEST_F(SessionTest, StartsDisconnected) {
    auto session = make_session();
    EXPECT_FALSE(session->is_connected());
    EXPECT_EQ(session->state(), SessionState::Disconnected);
    EXPECT_EQ(remote->authenticate_calls, 0);
}

TEST_F(SessionTest, ConnectAuthenticatesWithConfig) {
    auto config = fake_connection_config();
    config.port = 2222;
    auto session = make_session(config);

    auto result = session->connect();
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_TRUE(session->is_connected());
    EXPECT_EQ(remote->authenticate_calls, 1);
    EXPECT_EQ(remote->last_config.hostname, "ft.example.net");
    EXPECT_EQ(remote->last_config.port, 2222);
}

TEST_F(SessionTest, ConnectIsIdempotent) {
    auto session = make_session();
    ASSERT_TRUE(session->connect().is_ok());
    ASSERT_TRUE(session->connect().is_ok());
    EXPECT_EQ(remote->authenticate_calls, 1);
}

TEST_F(SessionTest, ConnectReportsStatus) {
    auto session = make_session();
    std::vector<std::string> messages;
    ASSERT_TRUE(session->connect([&](const std::string& m) { messages.push_back(m); }).is_ok());
    ASSERT_FALSE(messages.empty());
    EXPECT_EQ(messages.back(), "Connected to ft.example.net");
}

TEST_F(SessionTest, AuthenticationFailureLeavesDisconnected) {
    remote->auth_failure = ErrorKind::Authentication;
    auto session = make_session();

    auto result = session->connect();
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.kind, ErrorKind::Authentication);
    EXPECT_FALSE(session->is_connected());
    // Partial state is released immediately
    EXPECT_EQ(remote->close_calls, 1);
}

TEST_F(SessionTest, ConnectionFailureKind) {
    remote->auth_failure = ErrorKind::Connection;
    auto session = make_session();
    EXPECT_EQ(session->connect().kind, ErrorKind::Connection);
}

TEST_F(SessionTest, MissingSettingsNeverReachBackend) {
    auto config = fake_connection_config();
    config.hostname.clear();
    auto session = make_session(config);

    auto result = session->connect();
    EXPECT_EQ(result.kind, ErrorKind::Configuration);
    EXPECT_EQ(remote->authenticate_calls, 0);
}

TEST_F(SessionTest, CloseIsIdempotent) {
    auto session = make_session();
    ASSERT_TRUE(session->connect().is_ok());

    session->close();
    session->close();
    EXPECT_FALSE(session->is_connected());
    EXPECT_EQ(remote->close_calls, 1);
}

TEST_F(SessionTest, CloseWithoutConnectTouchesNothing) {
    auto session = make_session();
    session->close();
    EXPECT_EQ(remote->close_calls, 0);
}

TEST_F(SessionTest, CloseAfterFailedConnectIsSafe) {
    remote->auth_failure = ErrorKind::Authentication;
    auto session = make_session();
    EXPECT_TRUE(session->connect().is_err());
    session->close();
    EXPECT_EQ(remote->close_calls, 1);
}

TEST_F(SessionTest, ReconnectAfterClose) {
    auto session = make_session();
    ASSERT_TRUE(session->connect().is_ok());
    session->close();
    ASSERT_TRUE(session->connect().is_ok());
    EXPECT_TRUE(session->is_connected());
    EXPECT_EQ(remote->authenticate_calls, 2);
}

TEST_F(SessionTest, DestructorReleasesConnection) {
    {
        auto session = make_session();
        ASSERT_TRUE(session->connect().is_ok());
    }
    EXPECT_EQ(remote->close_calls, 1);
}

TEST_F(SessionTest, OperationsRequireConnection) {
    remote->add_file("/outgoing/a.csv", "x");
    auto session = make_session();
    auto local = fs::temp_directory_path() / "slate_session_guard";

    EXPECT_EQ(session->list_entries("/outgoing").kind, ErrorKind::NotConnected);
    EXPECT_EQ(session->list_files("/outgoing").kind, ErrorKind::NotConnected);
    EXPECT_EQ(session->list_directories("/outgoing").kind, ErrorKind::NotConnected);
    EXPECT_EQ(session->list_all("/outgoing").kind, ErrorKind::NotConnected);
    EXPECT_EQ(session->create_directory("/new").kind, ErrorKind::NotConnected);
    EXPECT_EQ(session->download_file("/outgoing/a.csv", local / "a.csv").kind, ErrorKind::NotConnected);
    EXPECT_EQ(session->upload_file(local / "a.csv", "/a.csv").kind, ErrorKind::NotConnected);
    EXPECT_EQ(session->download_matching("/outgoing", "", local).kind, ErrorKind::NotConnected);
    EXPECT_EQ(session->download_files({"/outgoing/a.csv"}, local).kind, ErrorKind::NotConnected);
    EXPECT_EQ(session->upload_files({local / "a.csv"}, "/in").kind, ErrorKind::NotConnected);
    EXPECT_EQ(session->download_directory("/outgoing", local).kind, ErrorKind::NotConnected);
    EXPECT_EQ(session->upload_directory(local, "/in").kind, ErrorKind::NotConnected);

    EXPECT_EQ(remote->remote_calls, 0);
    EXPECT_FALSE(fs::exists(local));
}

TEST_F(SessionTest, OperationsFailAgainAfterClose) {
    remote->add_dir("/outgoing");
    auto session = make_session();
    ASSERT_TRUE(session->connect().is_ok());
    ASSERT_TRUE(session->list_all("/outgoing").is_ok());
    int calls = remote->remote_calls;

    session->close();
    EXPECT_EQ(session->list_all("/outgoing").kind, ErrorKind::NotConnected);
    EXPECT_EQ(remote->remote_calls, calls);
}

// ── SessionScope ─────────────────────────────────────────────

TEST_F(SessionTest, ScopeConnectsAndCloses) {
    auto session = make_session();
    {
        SessionScope scope(*session);
        ASSERT_TRUE(scope.ok());
        EXPECT_TRUE(scope.session().is_connected());
    }
    EXPECT_FALSE(session->is_connected());
    EXPECT_EQ(remote->close_calls, 1);
}

TEST_F(SessionTest, ScopeClosesOnException) {
    auto session = make_session();
    try {
        SessionScope scope(*session);
        ASSERT_TRUE(scope.ok());
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(session->is_connected());
    EXPECT_EQ(remote->close_calls, 1);
}

TEST_F(SessionTest, ScopeReportsFailedConnect) {
    remote->auth_failure = ErrorKind::Authentication;
    auto session = make_session();
    {
        SessionScope scope(*session);
        EXPECT_FALSE(scope.ok());
        EXPECT_EQ(scope.status().kind, ErrorKind::Authentication);
    }
    // Released by the failed connect; the scope's close() has nothing left to do
    EXPECT_EQ(remote->close_calls, 1);
    EXPECT_FALSE(session->is_connected());
}
