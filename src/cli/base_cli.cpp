#include "base_cli.hpp"
#include "theme.hpp"
#include <algorithm>
#include <iostream>
#include <fmt/format.h>
#include <sftp/libssh2_backend.hpp>

std::string CommandArgs::get(const std::string& name, const std::string& fallback) const {
    auto it = options.find(name);
    return it == options.end() ? fallback : it->second;
}

BaseCLI::BaseCLI(std::optional<fs::path> config_path)
    : config_path_(std::move(config_path)),
      backend_factory_([] { return std::make_unique<Libssh2Backend>(); }) {
}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& help,
                          std::vector<std::string> options,
                          const std::string& usage) {
    commands_[name] = {std::move(handler), help, std::move(options), usage};
}

bool BaseCLI::require_config() {
    if (config.has_value()) {
        return true;
    }

    auto result = config_path_ ? Config::load_file(*config_path_) : Config::load();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        if (!config_path_) {
            std::cout << theme::step("Create one with 'slate setup' and fill in your connection details.");
        }
        return false;
    }
    config = result.value;
    return true;
}

std::unique_ptr<SlateSession> BaseCLI::make_session() const {
    return std::make_unique<SlateSession>(config.value().connection(), backend_factory_());
}

Result<CommandArgs> BaseCLI::parse_args(const Command& cmd, const std::vector<std::string>& args) {
    CommandArgs parsed;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& name = args[i];
        if (std::find(cmd.options.begin(), cmd.options.end(), name) == cmd.options.end()) {
            return Result<CommandArgs>::Err(ErrorKind::Configuration, "Unknown argument: " + name);
        }
        if (i + 1 >= args.size()) {
            return Result<CommandArgs>::Err(ErrorKind::Configuration, "Missing value for " + name);
        }
        parsed.options[name] = args[++i];
    }
    return Result<CommandArgs>::Ok(std::move(parsed));
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'slate --help' for available commands.");
        return 1;
    }

    auto parsed = parse_args(it->second, args);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step(fmt::format("Usage: slate {} {}", command, it->second.usage));
        return 1;
    }

    return it->second.handler(*this, parsed.value);
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Files", {"list", "download", "upload", "mkdir"}},
        {"Setup", {"setup"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << theme::section(cat_name);
        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::usage("slate " + name, it->second.usage, it->second.help);
            }
        }
    }
    std::cout << "\n";
}
