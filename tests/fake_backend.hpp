#pragma once

#include <sftp/backend.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

// In-memory remote filesystem. Tests keep a shared_ptr to inspect it after
// the FakeBackend has been moved into a session.
struct FakeRemote {
    struct Node {
        bool is_dir = false;
        std::string data;
        std::int64_t mtime = 0;
        unsigned mode = 0;
    };

    std::map<std::string, Node> nodes;
    std::vector<std::string> order;              // creation order = listing order

    int authenticate_calls = 0;
    int close_calls = 0;
    int remote_calls = 0;                        // list/stat/open/mkdir
    int keepalive_calls = 0;
    ConnectionConfig last_config;

    ErrorKind auth_failure = ErrorKind::None;    // authenticate() fails with this kind
    ErrorKind keepalive_failure = ErrorKind::None;
    std::map<std::string, ErrorKind> failures;   // every op on the path fails with this kind
    size_t write_limit = 0;                      // bytes accepted per write(), 0 = unlimited

    FakeRemote() {
        Node root;
        root.is_dir = true;
        nodes["/"] = root;
    }

    static std::string normalize(std::string p) {
        if (p.empty() || p == ".") return "/";
        if (p.rfind("./", 0) == 0) p = p.substr(1);
        if (p[0] != '/') p = "/" + p;
        while (p.size() > 1 && p.back() == '/') p.pop_back();
        return p;
    }

    void add_dir(const std::string& path) {
        auto p = normalize(path);
        if (nodes.count(p)) return;
        auto parent = remote_dirname(p);
        if (!parent.empty() && parent != p) add_dir(parent);
        Node node;
        node.is_dir = true;
        node.mode = 0755;
        nodes[p] = node;
        order.push_back(p);
    }

    void add_file(const std::string& path, const std::string& data, std::int64_t mtime = 0) {
        auto p = normalize(path);
        add_dir(remote_dirname(p));
        if (!nodes.count(p)) order.push_back(p);
        Node node;
        node.data = data;
        node.mtime = mtime;
        node.mode = 0644;
        nodes[p] = node;
    }

    bool has_file(const std::string& path) const {
        auto it = nodes.find(normalize(path));
        return it != nodes.end() && !it->second.is_dir;
    }

    bool has_dir(const std::string& path) const {
        auto it = nodes.find(normalize(path));
        return it != nodes.end() && it->second.is_dir;
    }

    std::string content(const std::string& path) const {
        auto it = nodes.find(normalize(path));
        return it == nodes.end() ? "" : it->second.data;
    }

    void fail(const std::string& path, ErrorKind kind) {
        failures[normalize(path)] = kind;
    }
};

class FakeRemoteFile : public RemoteFile {
public:
    FakeRemoteFile(std::shared_ptr<FakeRemote> remote, std::string path)
        : remote_(std::move(remote)), path_(std::move(path)) {}

    Result<size_t> read(char* buf, size_t len) override {
        const auto& data = remote_->nodes[path_].data;
        size_t n = std::min(len, data.size() - std::min(offset_, data.size()));
        std::copy(data.begin() + offset_, data.begin() + offset_ + n, buf);
        offset_ += n;
        return Result<size_t>::Ok(n);
    }

    Result<size_t> write(const char* buf, size_t len) override {
        size_t n = remote_->write_limit ? std::min(len, remote_->write_limit) : len;
        remote_->nodes[path_].data.append(buf, n);
        return Result<size_t>::Ok(n);
    }

private:
    std::shared_ptr<FakeRemote> remote_;
    std::string path_;
    size_t offset_ = 0;
};

class FakeBackend : public SftpBackend {
public:
    explicit FakeBackend(std::shared_ptr<FakeRemote> remote) : remote_(std::move(remote)) {}

    Result<void> authenticate(const ConnectionConfig& config, StatusCallback callback) override {
        remote_->authenticate_calls++;
        remote_->last_config = config;
        if (remote_->auth_failure != ErrorKind::None) {
            return Result<void>::Err(remote_->auth_failure, "fake authentication rejected");
        }
        if (callback) callback("Authenticated (fake)");
        return Result<void>::Ok();
    }

    void close() override {
        remote_->close_calls++;
    }

    Result<std::vector<RemoteEntry>> list_directory(const std::string& path) override {
        auto p = FakeRemote::normalize(path);
        auto injected = enter(p);
        if (injected.is_err()) return Result<std::vector<RemoteEntry>>::Err(injected.kind, injected.error);

        auto it = remote_->nodes.find(p);
        if (it == remote_->nodes.end()) {
            return Result<std::vector<RemoteEntry>>::Err(ErrorKind::RemoteNotFound, "No such file: " + path);
        }
        if (!it->second.is_dir) {
            return Result<std::vector<RemoteEntry>>::Err(ErrorKind::Remote, path + " is not a directory");
        }

        std::vector<RemoteEntry> entries;
        for (const auto& child : remote_->order) {
            if (child != "/" && remote_dirname(child) == p) {
                entries.push_back(entry_for(child));
            }
        }
        return Result<std::vector<RemoteEntry>>::Ok(entries);
    }

    Result<RemoteEntry> stat(const std::string& path) override {
        auto p = FakeRemote::normalize(path);
        auto injected = enter(p);
        if (injected.is_err()) return Result<RemoteEntry>::Err(injected.kind, injected.error);

        if (!remote_->nodes.count(p)) {
            return Result<RemoteEntry>::Err(ErrorKind::RemoteNotFound, "No such file: " + path);
        }
        return Result<RemoteEntry>::Ok(entry_for(p));
    }

    Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) override {
        auto p = FakeRemote::normalize(path);
        auto injected = enter(p);
        if (injected.is_err()) return Result<std::unique_ptr<RemoteFile>>::Err(injected.kind, injected.error);

        auto it = remote_->nodes.find(p);
        if (it == remote_->nodes.end()) {
            return Result<std::unique_ptr<RemoteFile>>::Err(ErrorKind::RemoteNotFound, "No such file: " + path);
        }
        if (it->second.is_dir) {
            return Result<std::unique_ptr<RemoteFile>>::Err(ErrorKind::Remote, path + " is a directory");
        }
        return Result<std::unique_ptr<RemoteFile>>::Ok(std::make_unique<FakeRemoteFile>(remote_, p));
    }

    Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path, unsigned mode) override {
        auto p = FakeRemote::normalize(path);
        auto injected = enter(p);
        if (injected.is_err()) return Result<std::unique_ptr<RemoteFile>>::Err(injected.kind, injected.error);

        if (!remote_->has_dir(remote_dirname(p))) {
            return Result<std::unique_ptr<RemoteFile>>::Err(ErrorKind::RemoteNotFound, "No such file: " + path);
        }
        if (remote_->has_dir(p)) {
            return Result<std::unique_ptr<RemoteFile>>::Err(ErrorKind::Remote, path + " is a directory");
        }
        remote_->add_file(p, "");
        remote_->nodes[p].mode = mode;
        return Result<std::unique_ptr<RemoteFile>>::Ok(std::make_unique<FakeRemoteFile>(remote_, p));
    }

    Result<void> mkdir(const std::string& path, unsigned mode) override {
        auto p = FakeRemote::normalize(path);
        auto injected = enter(p);
        if (injected.is_err()) return injected;

        if (remote_->nodes.count(p)) {
            return Result<void>::Err(ErrorKind::Remote, path + " already exists");
        }
        if (!remote_->has_dir(remote_dirname(p))) {
            return Result<void>::Err(ErrorKind::RemoteNotFound, "No such file: " + path);
        }
        remote_->add_dir(p);
        remote_->nodes[p].mode = mode;
        return Result<void>::Ok();
    }

    Result<void> keepalive() override {
        remote_->keepalive_calls++;
        if (remote_->keepalive_failure != ErrorKind::None) {
            return Result<void>::Err(remote_->keepalive_failure, "fake keepalive rejected");
        }
        return Result<void>::Ok();
    }

private:
    std::shared_ptr<FakeRemote> remote_;

    Result<void> enter(const std::string& p) {
        remote_->remote_calls++;
        auto it = remote_->failures.find(p);
        if (it != remote_->failures.end()) {
            return Result<void>::Err(it->second, "injected failure on " + p);
        }
        return Result<void>::Ok();
    }

    RemoteEntry entry_for(const std::string& p) const {
        const auto& node = remote_->nodes.at(p);
        RemoteEntry entry;
        entry.name = remote_basename(p);
        entry.is_directory = node.is_dir;
        entry.size = node.data.size();
        entry.modified_time = node.mtime;
        entry.permissions = node.mode;
        return entry;
    }
};

// Connection settings that pass validation; the key file is never read by the fake.
inline ConnectionConfig fake_connection_config() {
    ConnectionConfig config;
    config.hostname = "ft.example.net";
    config.username = "data-integration";
    config.private_key_path = "/nonexistent/slate_rsa";
    return config;
}
