#pragma once

#include "base_cli.hpp"
#include <optional>
#include <filesystem>
#include <string>
#include <vector>

// Forward declarations for command registration
void register_transfer_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);

class SlateCLI : public BaseCLI {
public:
    explicit SlateCLI(std::optional<std::filesystem::path> config_path = std::nullopt);
};

void print_usage(const SlateCLI& cli);

// Top-level dispatch for argv (without the program name). Returns the exit status.
int run_slate(const std::vector<std::string>& argv);
