#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <core/config.hpp>

static int do_setup(BaseCLI& cli, const CommandArgs& args) {
    bool existed = global_config_exists();

    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + result.error);
        return 1;
    }

    std::cout << theme::banner();
    std::cout << theme::section("Setup");

    auto path = get_global_config_path().string();
    if (existed) {
        std::cout << theme::step("Config already exists, leaving it unchanged.");
    } else {
        std::cout << theme::ok("Created default config.");
    }
    std::cout << theme::kv("Config", path);
    std::cout << "\n";
    std::cout << theme::dim("    Edit sftp.host, sftp.user and sftp.private_key_path, then run") << "\n";
    std::cout << theme::dim("    'slate list' to check the connection.") << "\n";
    std::cout << theme::dim("    A slate.yaml in the current directory overrides any of these keys.") << "\n\n";
    return 0;
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("setup", do_setup, "Create a default ~/.slate/config.yaml");
}
