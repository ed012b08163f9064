#pragma once

#include <locus/config.hpp>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace locus::path {

// Filesystem oracle consulted by the resolver. Tests substitute a fake;
// production code uses LocalFilesystemPolicy.
class FilesystemPolicy {
public:
    virtual ~FilesystemPolicy() = default;

    // True only if an entry exists at `path` and `path` is not on a
    // network-backed mount or under one of `ignored_prefixes`.
    virtual bool exists_locally(const std::string& path,
                                const std::vector<std::string>& ignored_prefixes) = 0;

    // True if `path` falls under one of `ignored_prefixes` (or a built-in
    // network root for policies that have them).
    virtual bool has_forbidden_prefix(const std::string& path,
                                      const std::vector<std::string>& ignored_prefixes) const = 0;
};

// Automount roots that are always treated as network-backed.
const std::vector<std::string>& builtin_network_roots();

// True if `path` starts with any non-empty entry of `prefixes`.
bool starts_with_any(const std::string& path, const std::vector<std::string>& prefixes);

// statfs() the mount holding `path`. Err(IO) if it cannot be queried.
Result<bool> is_network_filesystem(const std::string& path);

class LocalFilesystemPolicy : public FilesystemPolicy {
public:
    explicit LocalFilesystemPolicy(
        std::chrono::milliseconds probe_interval = kDefaultProbeInterval);

    LocalFilesystemPolicy(const LocalFilesystemPolicy&) = delete;
    LocalFilesystemPolicy& operator=(const LocalFilesystemPolicy&) = delete;

    bool exists_locally(const std::string& path,
                        const std::vector<std::string>& ignored_prefixes) override;

    bool has_forbidden_prefix(const std::string& path,
                              const std::vector<std::string>& ignored_prefixes) const override;

    std::chrono::milliseconds probe_interval() const { return interval_; }

private:
    // Wait until at least interval_ has passed since the previous probe
    void throttle();

    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::chrono::steady_clock::time_point last_probe_{};
    bool probed_ = false;
};

} // namespace locus::path
