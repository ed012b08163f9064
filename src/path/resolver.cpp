#include <locus/path/resolver.hpp>
#include <locus/log.hpp>

#include <cstdlib>
#include <filesystem>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace locus::path {

namespace fs = std::filesystem;

static std::string home_directory() {
    const char* home = std::getenv("HOME");
    if (home && *home) return home;
    if (const passwd* pw = ::getpwuid(::getuid())) {
        if (pw->pw_dir) return pw->pw_dir;
    }
    return "";
}

static std::string user_home_directory(const std::string& user) {
    const passwd* pw = ::getpwnam(user.c_str());
    if (!pw || !pw->pw_dir) return "";
    return pw->pw_dir;
}

static std::string drop_trailing_slashes(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    return path;
}

std::string expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~') return drop_trailing_slashes(path);

    size_t slash = path.find('/');
    std::string user = path.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
    std::string rest = slash == std::string::npos ? "" : path.substr(slash);

    std::string home = user.empty() ? home_directory() : user_home_directory(user);
    if (home.empty()) {
        log::trace("  cannot expand ~%s", user.c_str());
        return drop_trailing_slashes(path);
    }

    if (!rest.empty() && home.back() == '/') home.pop_back();
    return drop_trailing_slashes(home + rest);
}

std::string standardize_path(const std::string& path) {
    return drop_trailing_slashes(fs::path(path).lexically_normal().string());
}

Result<std::string> resolve_path(const std::string& stem,
                                 const std::string& working_directory,
                                 FilesystemPolicy& policy,
                                 const std::vector<std::string>& ignored_prefixes) {
    log::debug("resolving %s in %s",
               stem.c_str(), working_directory.c_str());
    if (stem.empty()) {
        log::debug("  no: it is empty");
        return LocusError{LocusError::InvalidArg, "path is empty"};
    }

    std::string path = expand_tilde(stem);
    log::debug("  expanded to %s", path.c_str());
    if (path.empty()) {
        // Everything was stripped out; this must not become the working directory
        return LocusError{LocusError::InvalidArg, "nothing left of '" + stem + "'"};
    }

    if (path[0] != '/') {
        if (working_directory.empty()) {
            return LocusError{LocusError::InvalidArg,
                "relative path '" + path + "' without a working directory"};
        }
        path = (fs::path(working_directory) / path).string();
        log::debug("  anchored at working directory: %s", path.c_str());
    }

    // Probe the path as written; it is standardized only once it is known
    // to exist locally.
    log::debug("  probing %s", path.c_str());
    if (!policy.exists_locally(path, ignored_prefixes)) {
        log::debug("  no: nothing local at %s", path.c_str());
        return LocusError{LocusError::NotFound, "no local file at " + path};
    }
    log::debug("  exists: %s", path.c_str());

    path = standardize_path(path);
    log::debug("  standardized to %s", path.c_str());
    if (policy.has_forbidden_prefix(path, ignored_prefixes)) {
        log::debug("  no: %s is under an ignored prefix", path.c_str());
        return LocusError{LocusError::Forbidden,
            "standardized path " + path + " is under an ignored prefix"};
    }

    return Result<std::string>::ok(std::move(path));
}

} // namespace locus::path
