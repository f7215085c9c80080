#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.slate/config.yaml
    static Result<Config> load_global();

    // Load project config from ./slate.yaml
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Load both and combine (keys in the project file override global ones)
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Load a single explicit file (--config), ignoring global and project files
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text, alone or on top of an existing config
    static Result<Config> parse(const std::string& yaml_text);
    static Result<Config> parse(const std::string& yaml_text, const Config& base);

    // Accessors
    const ConnectionConfig& connection() const { return connection_; }
    const fs::path& download_dir() const { return download_dir_; }
    const fs::path& source() const { return source_; }

public:
    Config() = default;

private:
    ConnectionConfig connection_;
    fs::path download_dir_ = "downloads";
    fs::path source_;
};

// Checks the settings a connect() needs; ErrorKind::Configuration on failure.
Result<void> validate_connection_config(const ConnectionConfig& config);

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config. Never overwrites an existing file.
Result<void> create_default_global_config();
