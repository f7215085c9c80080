#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

// ── Helpers ──────────────────────────────────────────────────

static void print_status(const std::string& msg) {
    std::cout << theme::dim("    " + msg) << "\n";
}

// Opens the session or prints why it could not.
static bool connect_or_report(SessionScope& scope) {
    if (scope.ok()) return true;
    std::cout << theme::fail("Connection failed: " + scope.status().error);
    return false;
}

static std::string remote_dir_arg(BaseCLI& cli, const CommandArgs& args) {
    if (args.has("--dir")) return args.get("--dir");
    return cli.config->connection().default_remote_dir.value_or(".");
}

// ── Commands ─────────────────────────────────────────────────

static int do_list(BaseCLI& cli, const CommandArgs& args) {
    if (!cli.require_config()) return 1;

    std::string dir = remote_dir_arg(cli, args);
    auto session = cli.make_session();
    SessionScope scope(*session, print_status);
    if (!connect_or_report(scope)) return 1;

    auto entries = session->list_entries(dir);
    if (entries.is_err()) {
        std::cout << theme::fail("Error listing files: " + entries.error);
        return 1;
    }

    std::cout << theme::section("Files in " + dir);

    size_t shown = 0;
    for (const auto& entry : entries.value) {
        if (entry.is_directory) continue;
        if (shown++ == 0) {
            std::cout << theme::dim(fmt::format("    {:<48} {:>16}  {}", "Filename", "Size", "Updated")) << "\n";
            std::cout << theme::rule(88);
        }
        std::cout << fmt::format("    {:<48} {:>16}  {}\n", entry.name,
                                 format_size_kb(entry.size), format_mtime(entry.modified_time));
    }

    if (shown == 0) {
        std::cout << theme::dim("    No files found in the specified directory.") << "\n";
    }
    std::cout << "\n";
    return 0;
}

static int do_download(BaseCLI& cli, const CommandArgs& args) {
    if (!cli.require_config()) return 1;

    std::string dir = remote_dir_arg(cli, args);
    std::string pattern = args.get("--pattern");
    fs::path local_dir = args.has("--local-dir")
        ? fs::path(expand_home(args.get("--local-dir")))
        : cli.config->download_dir();

    auto session = cli.make_session();
    SessionScope scope(*session, print_status);
    if (!connect_or_report(scope)) return 1;

    std::cout << theme::section(pattern.empty()
        ? "Downloading all files from " + dir
        : fmt::format("Downloading files matching '{}' from {}", pattern, dir));

    session->on_transfer([](const TransferResult& r) {
        std::string name = remote_basename(r.source_path);
        if (r.ok()) {
            std::cout << theme::ok(fmt::format("{}  {}", name, theme::dim(format_size_kb(r.bytes_transferred))));
        } else {
            std::cout << theme::fail(fmt::format("{}  {}", name, r.reason));
        }
    });

    auto report = session->download_matching(dir, pattern, local_dir);
    if (report.is_err() && report.kind != ErrorKind::AllTransfersFailed) {
        std::cout << theme::fail(report.error);
        return 1;
    }

    std::cout << "\n";
    std::cout << theme::kv("Summary", fmt::format("{} of {} files downloaded",
                                                  report.value.succeeded(), report.value.results.size()));
    std::cout << theme::kv("Saved to", local_dir.string());
    std::cout << "\n";
    return report.is_ok() ? 0 : 1;
}

static int do_upload(BaseCLI& cli, const CommandArgs& args) {
    if (!args.has("--file")) {
        std::cout << theme::fail("Missing --file");
        std::cout << theme::step("Usage: slate upload --file PATH [--dir PATH]");
        return 1;
    }
    if (!cli.require_config()) return 1;

    fs::path local_path = expand_home(args.get("--file"));
    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        std::cout << theme::fail("File not found: " + local_path.string());
        return 1;
    }

    std::string dir = remote_dir_arg(cli, args);
    std::string remote_path = join_remote(dir, local_path.filename().string());

    auto session = cli.make_session();
    SessionScope scope(*session, print_status);
    if (!connect_or_report(scope)) return 1;

    auto result = session->upload_file(local_path, remote_path);
    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("Uploading {} to {} failed: {}",
                                             local_path.filename().string(), dir, result.error));
        return 1;
    }

    std::cout << theme::ok(fmt::format("Uploaded {} to {} ({})", local_path.filename().string(),
                                       remote_path, format_size_kb(result.value.bytes_transferred)));
    return 0;
}

static int do_mkdir(BaseCLI& cli, const CommandArgs& args) {
    if (!args.has("--dir")) {
        std::cout << theme::fail("Missing --dir");
        std::cout << theme::step("Usage: slate mkdir --dir PATH");
        return 1;
    }
    if (!cli.require_config()) return 1;

    std::string dir = args.get("--dir");
    auto session = cli.make_session();
    SessionScope scope(*session, print_status);
    if (!connect_or_report(scope)) return 1;

    auto result = session->create_directory(dir);
    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("Failed to create directory {}: {}", dir, result.error));
        return 1;
    }
    std::cout << theme::ok("Created " + dir);
    return 0;
}

void register_transfer_commands(BaseCLI& cli) {
    cli.add_command("list", do_list, "List files in a remote directory",
                    {"--dir"}, "[--dir PATH]");
    cli.add_command("download", do_download, "Download files whose name contains TEXT",
                    {"--dir", "--pattern", "--local-dir"},
                    "[--dir PATH] [--pattern TEXT] [--local-dir PATH]");
    cli.add_command("upload", do_upload, "Upload one file",
                    {"--file", "--dir"}, "--file PATH [--dir PATH]");
    cli.add_command("mkdir", do_mkdir, "Create a remote directory",
                    {"--dir"}, "--dir PATH");
}
