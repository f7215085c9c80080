#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <sftp/backend.hpp>
#include <sftp/slate_session.hpp>

namespace fs = std::filesystem;

// Parsed "--name value" options of one command invocation.
struct CommandArgs {
    std::map<std::string, std::string> options;

    bool has(const std::string& name) const { return options.count(name) > 0; }
    std::string get(const std::string& name, const std::string& fallback = "") const;
};

class BaseCLI {
public:
    explicit BaseCLI(std::optional<fs::path> config_path = std::nullopt);
    virtual ~BaseCLI() = default;

    // Handlers return the process exit status.
    using CommandHandler = std::function<int(BaseCLI&, const CommandArgs&)>;
    using BackendFactory = std::function<std::unique_ptr<SftpBackend>()>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help,
                     std::vector<std::string> options = {},
                     const std::string& usage = "");

    // Loads configuration on first use; prints the failure otherwise.
    bool require_config();

    // New, unconnected session for the loaded configuration.
    std::unique_ptr<SlateSession> make_session() const;

    // Replaces the libssh2 backend (tests).
    void set_backend_factory(BackendFactory factory) { backend_factory_ = std::move(factory); }

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    std::optional<Config> config;

protected:
    struct Command {
        CommandHandler handler;
        std::string help;
        std::vector<std::string> options;
        std::string usage;
    };
    std::map<std::string, Command> commands_;

private:
    std::optional<fs::path> config_path_;
    BackendFactory backend_factory_;

    static Result<CommandArgs> parse_args(const Command& cmd, const std::vector<std::string>& args);
};
