#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path home_dir;
    fs::path project_dir;
    std::string saved_home;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "slate_config_test";
        fs::remove_all(test_dir);
        home_dir = test_dir / "home";
        project_dir = test_dir / "project";
        fs::create_directories(home_dir);
        fs::create_directories(project_dir);

        const char* home = std::getenv("HOME");
        saved_home = home ? home : "";
        setenv("HOME", home_dir.c_str(), 1);
    }

    void TearDown() override {
        setenv("HOME", saved_home.c_str(), 1);
        fs::remove_all(test_dir);
    }

    void write_global(const std::string& content) {
        fs::create_directories(home_dir / ".slate");
        std::ofstream(home_dir / ".slate" / "config.yaml") << content;
    }

    void write_project(const std::string& content) {
        std::ofstream(project_dir / "slate.yaml") << content;
    }
};

TEST_F(ConfigTest, ParsesAllKeys) {
    auto result = Config::parse(R"(
sftp:
  host: "ft.example.net"
  port: 2222
  user: "data-integration"
  private_key_path: "/keys/slate_rsa"
  default_remote_dir: "/outgoing/"
  timeout: 30
local:
  download_dir: "/data/slate"
)");
    ASSERT_TRUE(result.is_ok()) << result.error;

    const auto& conn = result.value.connection();
    EXPECT_EQ(conn.hostname, "ft.example.net");
    EXPECT_EQ(conn.port, 2222);
    EXPECT_EQ(conn.username, "data-integration");
    EXPECT_EQ(conn.private_key_path, "/keys/slate_rsa");
    ASSERT_TRUE(conn.default_remote_dir.has_value());
    EXPECT_EQ(*conn.default_remote_dir, "/outgoing/");
    EXPECT_EQ(conn.timeout_secs, 30);
    EXPECT_EQ(result.value.download_dir(), fs::path("/data/slate"));
}

TEST_F(ConfigTest, Defaults) {
    auto result = Config::parse("sftp:\n  host: h\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.connection().port, 22);
    EXPECT_EQ(result.value.connection().timeout_secs, 0);
    EXPECT_FALSE(result.value.connection().default_remote_dir.has_value());
    EXPECT_EQ(result.value.download_dir(), fs::path("downloads"));
}

TEST_F(ConfigTest, ParseOverlaysBase) {
    auto base = Config::parse("sftp:\n  host: base-host\n  user: base-user\n  port: 2200\n");
    ASSERT_TRUE(base.is_ok());

    auto result = Config::parse("sftp:\n  host: overlay-host\n", base.value);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.connection().hostname, "overlay-host");
    EXPECT_EQ(result.value.connection().username, "base-user");
    EXPECT_EQ(result.value.connection().port, 2200);
}

TEST(ConnectionDefaults, PortIsSftpDefault) {
    ConnectionConfig c;
    EXPECT_EQ(c.port, DEFAULT_SFTP_PORT);
    EXPECT_EQ(c.timeout_secs, 0);
}

TEST_F(ConfigTest, ExpandsHome) {
    auto result = Config::parse("sftp:\n  private_key_path: \"~/.ssh/slate_rsa\"\nlocal:\n  download_dir: \"~/dl\"\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(fs::path(result.value.connection().private_key_path), home_dir / ".ssh" / "slate_rsa");
    EXPECT_EQ(result.value.download_dir(), home_dir / "dl");
}

TEST_F(ConfigTest, MalformedYaml) {
    auto result = Config::parse("sftp: [unclosed");
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.kind, ErrorKind::Configuration);
}

TEST_F(ConfigTest, BadPortType) {
    auto result = Config::parse("sftp:\n  port: twenty-two\n");
    EXPECT_EQ(result.kind, ErrorKind::Configuration);
}

TEST_F(ConfigTest, NoConfigFiles) {
    auto result = Config::load(project_dir);
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.kind, ErrorKind::Configuration);
    EXPECT_NE(result.error.find("slate setup"), std::string::npos);
}

TEST_F(ConfigTest, ProjectOverridesGlobal) {
    write_global("sftp:\n  host: global-host\n  user: global-user\n  private_key_path: /k\n");
    write_project("sftp:\n  host: project-host\n");

    auto result = Config::load(project_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.connection().hostname, "project-host");
    EXPECT_EQ(result.value.connection().username, "global-user");
    EXPECT_EQ(result.value.source(), project_dir / "slate.yaml");
}

TEST_F(ConfigTest, ProjectOnly) {
    write_project("sftp:\n  host: only-project\n");
    auto result = Config::load(project_dir);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.connection().hostname, "only-project");
}

TEST_F(ConfigTest, LoadExplicitFile) {
    write_global("sftp:\n  host: global-host\n");
    auto path = test_dir / "other.yaml";
    std::ofstream(path) << "sftp:\n  host: explicit-host\n";

    auto result = Config::load_file(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.connection().hostname, "explicit-host");

    EXPECT_EQ(Config::load_file(test_dir / "missing.yaml").kind, ErrorKind::Configuration);
}

TEST_F(ConfigTest, SetupCreatesDefaultOnce) {
    EXPECT_FALSE(global_config_exists());
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_TRUE(global_config_exists());

    auto loaded = Config::load_global();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.connection().hostname, "ft.example.net");

    std::ofstream(get_global_config_path()) << "sftp:\n  host: edited\n";
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_EQ(Config::load_global().value.connection().hostname, "edited");
}

// ── Validation ───────────────────────────────────────────────

static ConnectionConfig valid_config() {
    ConnectionConfig c;
    c.hostname = "ft.example.net";
    c.username = "data-integration";
    c.private_key_path = "/keys/slate_rsa";
    return c;
}

TEST(ConnectionValidation, Valid) {
    EXPECT_TRUE(validate_connection_config(valid_config()).is_ok());
}

TEST(ConnectionValidation, MissingFields) {
    auto c = valid_config();
    c.username.clear();
    c.private_key_path.clear();
    auto result = validate_connection_config(c);
    EXPECT_EQ(result.kind, ErrorKind::Configuration);
    EXPECT_EQ(result.error, "Missing connection settings: user, private_key_path");

    c.hostname.clear();
    EXPECT_EQ(validate_connection_config(c).error,
              "Missing connection settings: host, user, private_key_path");
}

TEST(ConnectionValidation, PortRange) {
    auto c = valid_config();
    c.port = 0;
    EXPECT_EQ(validate_connection_config(c).kind, ErrorKind::Configuration);
    c.port = 65536;
    EXPECT_EQ(validate_connection_config(c).kind, ErrorKind::Configuration);
    c.port = 65535;
    EXPECT_TRUE(validate_connection_config(c).is_ok());
}

TEST(ConnectionValidation, NegativeTimeout) {
    auto c = valid_config();
    c.timeout_secs = -1;
    EXPECT_EQ(validate_connection_config(c).kind, ErrorKind::Configuration);
}
