#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "transport_handle.hpp"

// Lists a single remote directory level. Results always come from a fresh
// remote query and keep the server's order. Recursion is left to callers.
class DirectoryLister {
public:
    explicit DirectoryLister(TransportHandle& transport);

    // An empty dir means the configured default directory, or "." without one.
    std::string resolve_dir(const std::string& dir) const;

    Result<std::vector<RemoteEntry>> list_entries(const std::string& dir = "");
    Result<std::vector<std::string>> list_files(const std::string& dir = "");
    Result<std::vector<std::string>> list_directories(const std::string& dir = "");
    Result<DirectoryListing> list_all(const std::string& dir = "");

private:
    TransportHandle& transport_;
};
