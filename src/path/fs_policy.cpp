#include <locus/path/fs_policy.hpp>
#include <locus/log.hpp>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>

#if defined(__linux__)
#include <sys/statfs.h>
#elif defined(__APPLE__) || defined(__FreeBSD__)
#include <sys/param.h>
#include <sys/mount.h>
#endif

namespace locus::path {

namespace fs = std::filesystem;

const std::vector<std::string>& builtin_network_roots() {
    static const std::vector<std::string> roots = {
        "/net",
        "/Network",
        "/automount",
        "/ifs",
    };
    return roots;
}

bool starts_with_any(const std::string& path, const std::vector<std::string>& prefixes) {
    for (const auto& prefix : prefixes) {
        // An empty prefix would match everything
        if (prefix.empty()) continue;
        if (path.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

Result<bool> is_network_filesystem(const std::string& path) {
#if defined(__linux__) || defined(__APPLE__) || defined(__FreeBSD__)
    struct statfs info {};
    if (::statfs(path.c_str(), &info) != 0) {
        return LocusError{LocusError::IO,
            "statfs(" + path + ") failed: " + std::strerror(errno)};
    }
#if defined(__linux__)
    switch (static_cast<unsigned long>(info.f_type)) {
        case 0x6969:      // NFS_SUPER_MAGIC
        case 0xFF534D42:  // CIFS
        case 0xFE534D42:  // SMB2
        case 0x517B:      // SMB
        case 0x5346414F:  // AFS
        case 0x73757245:  // CODA
        case 0x564C:      // NCP
            return Result<bool>::ok(true);
        default:
            return Result<bool>::ok(false);
    }
#else
    return Result<bool>::ok((info.f_flags & MNT_LOCAL) == 0);
#endif
#else
    (void)path;
    return Result<bool>::ok(false);
#endif
}

LocalFilesystemPolicy::LocalFilesystemPolicy(std::chrono::milliseconds probe_interval)
    : interval_(probe_interval) {}

void LocalFilesystemPolicy::throttle() {
    if (interval_.count() <= 0) return;

    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    if (probed_) {
        auto due = last_probe_ + interval_;
        if (now < due) {
            std::this_thread::sleep_for(due - now);
            now = std::chrono::steady_clock::now();
        }
    }
    last_probe_ = now;
    probed_ = true;
}

bool LocalFilesystemPolicy::has_forbidden_prefix(
    const std::string& path,
    const std::vector<std::string>& ignored_prefixes) const
{
    return starts_with_any(path, builtin_network_roots()) ||
           starts_with_any(path, ignored_prefixes);
}

bool LocalFilesystemPolicy::exists_locally(
    const std::string& path,
    const std::vector<std::string>& ignored_prefixes)
{
    log::trace("path cleaner: probing %s", path.c_str());
    throttle();

    // Excluded prefixes are rejected before anything touches the disk
    if (has_forbidden_prefix(path, ignored_prefixes)) {
        log::debug("    %s is under an ignored prefix", path.c_str());
        return false;
    }

    auto network = is_network_filesystem(path);
    if (network.is_err()) {
        log::trace("    %s", network.error().message.c_str());
        return false;
    }
    if (network.value()) {
        log::debug("    %s is on a network filesystem", path.c_str());
        return false;
    }

    std::error_code ec;
    return fs::exists(path, ec);
}

} // namespace locus::path
