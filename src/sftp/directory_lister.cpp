#include "directory_lister.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

DirectoryLister::DirectoryLister(TransportHandle& transport)
    : transport_(transport) {
}

std::string DirectoryLister::resolve_dir(const std::string& dir) const {
    if (!dir.empty()) return dir;
    const auto& configured = transport_.config().default_remote_dir;
    if (configured.has_value() && !configured->empty()) return *configured;
    return ".";
}

Result<std::vector<RemoteEntry>> DirectoryLister::list_entries(const std::string& dir) {
    std::string path = resolve_dir(dir);
    auto result = transport_.list_directory(path);
    if (result.is_err()) {
        slate_log(fmt::format("list {} failed [{}]: {}", path, error_kind_name(result.kind), result.error));
    } else {
        slate_log(fmt::format("list {}: {} entries", path, result.value.size()));
    }
    return result;
}

Result<std::vector<std::string>> DirectoryLister::list_files(const std::string& dir) {
    auto listing = list_all(dir);
    if (listing.is_err()) {
        return Result<std::vector<std::string>>::Err(listing.kind, listing.error);
    }
    return Result<std::vector<std::string>>::Ok(std::move(listing.value.files));
}

Result<std::vector<std::string>> DirectoryLister::list_directories(const std::string& dir) {
    auto listing = list_all(dir);
    if (listing.is_err()) {
        return Result<std::vector<std::string>>::Err(listing.kind, listing.error);
    }
    return Result<std::vector<std::string>>::Ok(std::move(listing.value.directories));
}

Result<DirectoryListing> DirectoryLister::list_all(const std::string& dir) {
    auto entries = list_entries(dir);
    if (entries.is_err()) {
        return Result<DirectoryListing>::Err(entries.kind, entries.error);
    }

    DirectoryListing listing;
    for (const auto& entry : entries.value) {
        if (entry.is_directory) {
            listing.directories.push_back(entry.name);
        } else {
            listing.files.push_back(entry.name);
        }
    }
    return Result<DirectoryListing>::Ok(std::move(listing));
}
