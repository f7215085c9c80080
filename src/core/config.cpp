#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / SLATE_CONFIG_DIRNAME;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / SLATE_CONFIG_FILENAME;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / SLATE_PROJECT_FILENAME;
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IO,
                                 "Failed to create " + config_path.parent_path().string() + ": " + ec.message());
    }

    // Default config content
    const char* default_config = R"(# Slate SFTP Configuration
# This file contains connection details. Keep it out of version control
# and readable only by you.

sftp:
  host: "ft.example.net"           # Your Slate SFTP hostname
  port: 22
  user: "data-integration"         # Your SFTP service account
  private_key_path: "~/.ssh/slate_rsa"   # RSA key without a passphrase
  default_remote_dir: "/outgoing/"
  timeout: 0                       # Seconds; 0 waits indefinitely

local:
  download_dir: "~/Downloads/slate_data"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::IO, "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    out.close();
    if (!out) {
        return Result<void>::Err(ErrorKind::IO, "Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

// Overlay keys present in an `sftp:` block onto existing connection settings.
static void overlay_sftp_config(const YAML::Node& node, ConnectionConfig& conn) {
    if (node["host"]) conn.hostname = node["host"].as<std::string>("");
    if (node["user"]) conn.username = node["user"].as<std::string>("");
    if (node["username"]) conn.username = node["username"].as<std::string>("");
    if (node["private_key_path"]) {
        conn.private_key_path = expand_home(node["private_key_path"].as<std::string>(""));
    }
    if (node["port"]) conn.port = node["port"].as<int>();
    if (node["timeout"]) conn.timeout_secs = node["timeout"].as<int>();

    if (node["default_remote_dir"]) {
        auto dir = node["default_remote_dir"].as<std::string>("");
        if (dir.empty()) {
            conn.default_remote_dir.reset();
        } else {
            conn.default_remote_dir = dir;
        }
    }
}

Result<Config> Config::parse(const std::string& yaml_text) {
    return parse(yaml_text, Config());
}

Result<Config> Config::parse(const std::string& yaml_text, const Config& base) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config = base;
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::Configuration, "Config root must be a mapping");
        }

        if (root["sftp"] && root["sftp"].IsMap()) {
            overlay_sftp_config(root["sftp"], config.connection_);
        }

        if (root["local"] && root["local"].IsMap()) {
            const auto& local = root["local"];
            if (local["download_dir"]) {
                config.download_dir_ = expand_home(local["download_dir"].as<std::string>("downloads"));
            }
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::Configuration,
                                   std::string("Failed to parse config: ") + e.what());
    }
}

static Result<std::string> read_text_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::string>::Err(ErrorKind::Configuration, "Cannot read config file " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::Ok(ss.str());
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(ErrorKind::Configuration, "Config not found at " + path.string());
    }

    auto text = read_text_file(path);
    if (text.is_err()) return Result<Config>::Err(text.kind, text.error);

    auto parsed = parse(text.value);
    if (parsed.is_err()) {
        return Result<Config>::Err(parsed.kind, path.string() + ": " + parsed.error);
    }
    parsed.value.source_ = path;
    return parsed;
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err(ErrorKind::Configuration,
                                   "Global config not found at " + get_global_config_path().string());
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::load_project(const fs::path& dir) {
    if (!project_config_exists(dir)) {
        return Result<Config>::Err(ErrorKind::Configuration,
                                   "Project config not found at " + get_project_config_path(dir).string());
    }
    return load_file(get_project_config_path(dir));
}

Result<Config> Config::load(const fs::path& project_dir) {
    bool have_global = global_config_exists();
    bool have_project = project_config_exists(project_dir);

    if (!have_global && !have_project) {
        return Result<Config>::Err(ErrorKind::Configuration,
            fmt::format("No configuration found ({} or {}). Run 'slate setup' first.",
                        get_global_config_path().string(),
                        get_project_config_path(project_dir).string()));
    }

    Config config;
    if (have_global) {
        auto global_result = load_global();
        if (global_result.is_err()) return global_result;
        config = global_result.value;
    }

    // Project file overlays only the keys it sets
    if (have_project) {
        auto path = get_project_config_path(project_dir);
        auto text = read_text_file(path);
        if (text.is_err()) return Result<Config>::Err(text.kind, text.error);

        auto merged = parse(text.value, config);
        if (merged.is_err()) {
            return Result<Config>::Err(merged.kind, path.string() + ": " + merged.error);
        }
        config = merged.value;
        config.source_ = path;
    }

    return Result<Config>::Ok(config);
}

Result<void> validate_connection_config(const ConnectionConfig& config) {
    std::vector<std::string> missing;
    if (config.hostname.empty()) missing.push_back("host");
    if (config.username.empty()) missing.push_back("user");
    if (config.private_key_path.empty()) missing.push_back("private_key_path");

    if (!missing.empty()) {
        return Result<void>::Err(ErrorKind::Configuration,
                                 fmt::format("Missing connection settings: {}", fmt::join(missing, ", ")));
    }

    if (config.port < 1 || config.port > 65535) {
        return Result<void>::Err(ErrorKind::Configuration,
                                 fmt::format("Invalid port {} (expected 1-65535)", config.port));
    }

    if (config.timeout_secs < 0) {
        return Result<void>::Err(ErrorKind::Configuration,
                                 fmt::format("Invalid timeout {} (expected 0 or more seconds)", config.timeout_secs));
    }

    return Result<void>::Ok();
}
