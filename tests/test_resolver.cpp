#include <catch2/catch.hpp>
#include <locus/path/resolver.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>

using namespace locus;
using namespace locus::path;
namespace fs = std::filesystem;

namespace {

// In-memory filesystem: a set of existing (lexically normalised) paths
struct FakeFilesystem : FilesystemPolicy {
    std::set<std::string> files;
    std::vector<std::string> probed;

    bool exists_locally(const std::string& path,
                        const std::vector<std::string>& ignored_prefixes) override {
        probed.push_back(path);
        if (starts_with_any(path, ignored_prefixes)) return false;
        return files.count(fs::path(path).lexically_normal().string()) > 0;
    }

    bool has_forbidden_prefix(const std::string& path,
                              const std::vector<std::string>& ignored_prefixes) const override {
        return starts_with_any(path, ignored_prefixes);
    }
};

// Sets HOME for the lifetime of the object
struct ScopedHome {
    std::string saved;
    bool had = false;

    explicit ScopedHome(const std::string& home) {
        if (const char* h = std::getenv("HOME")) {
            saved = h;
            had = true;
        }
        setenv("HOME", home.c_str(), 1);
    }

    ~ScopedHome() {
        if (had) setenv("HOME", saved.c_str(), 1);
        else unsetenv("HOME");
    }
};

} // namespace

// ===== Tilde expansion =====

TEST_CASE("tilde expands to HOME", "[resolver]") {
    ScopedHome home("/home/u");
    REQUIRE(expand_tilde("~") == "/home/u");
    REQUIRE(expand_tilde("~/notes.md") == "/home/u/notes.md");
    REQUIRE(expand_tilde("~/dir/") == "/home/u/dir");
}

TEST_CASE("HOME with a trailing slash", "[resolver]") {
    ScopedHome home("/home/u/");
    REQUIRE(expand_tilde("~/notes.md") == "/home/u/notes.md");
}

TEST_CASE("tilde of the root user", "[resolver]") {
    // root exists in every passwd database we run on
    auto expanded = expand_tilde("~root/x");
    REQUIRE(expanded.size() > 2);
    REQUIRE(expanded[0] == '/');
    REQUIRE(expanded.substr(expanded.size() - 2) == "/x");
}

TEST_CASE("unknown user is left alone", "[resolver]") {
    REQUIRE(expand_tilde("~no_such_user_locus/x") == "~no_such_user_locus/x");
}

TEST_CASE("paths without a leading tilde are unchanged", "[resolver]") {
    REQUIRE(expand_tilde("src/~tmp") == "src/~tmp");
    REQUIRE(expand_tilde("/abs/") == "/abs");
    REQUIRE(expand_tilde("/") == "/");
}

// ===== Standardization =====

TEST_CASE("standardize_path resolves dot segments", "[resolver]") {
    REQUIRE(standardize_path("/repo/./main.c") == "/repo/main.c");
    REQUIRE(standardize_path("/repo/src/../main.c") == "/repo/main.c");
    REQUIRE(standardize_path("/repo/src/..") == "/repo");
    REQUIRE(standardize_path("/repo//main.c") == "/repo/main.c");
    REQUIRE(standardize_path("/") == "/");
}

// ===== Resolution with a fake filesystem =====

TEST_CASE("relative stem is anchored at the working directory", "[resolver]") {
    FakeFilesystem fake;
    fake.files = {"/repo/main.c"};
    auto r = resolve_path("./main.c", "/repo", fake, {});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "/repo/main.c");
}

TEST_CASE("existence is probed before standardizing", "[resolver]") {
    FakeFilesystem fake;
    fake.files = {"/repo/main.c"};
    auto r = resolve_path("src/../main.c", "/repo", fake, {});
    REQUIRE(r.is_ok());
    REQUIRE(fake.probed == std::vector<std::string>{"/repo/src/../main.c"});
    REQUIRE(r.value() == "/repo/main.c");
}

TEST_CASE("absolute stem ignores the working directory", "[resolver]") {
    FakeFilesystem fake;
    fake.files = {"/etc/hosts"};
    auto r = resolve_path("/etc/hosts", "/repo", fake, {});
    REQUIRE(r.value() == "/etc/hosts");
}

TEST_CASE("empty stem fails without probing", "[resolver]") {
    FakeFilesystem fake;
    auto r = resolve_path("", "/repo", fake, {});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LocusError::InvalidArg);
    REQUIRE(fake.probed.empty());
}

TEST_CASE("relative stem without a working directory fails", "[resolver]") {
    FakeFilesystem fake;
    fake.files = {"main.c"};
    auto r = resolve_path("main.c", "", fake, {});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LocusError::InvalidArg);
    REQUIRE(fake.probed.empty());
}

TEST_CASE("missing file is NotFound", "[resolver]") {
    FakeFilesystem fake;
    auto r = resolve_path("nope.c", "/repo", fake, {});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LocusError::NotFound);
}

TEST_CASE("ignored prefix rejects before standardization", "[resolver]") {
    FakeFilesystem fake;
    fake.files = {"/mnt/net/secret.txt"};
    auto r = resolve_path("/mnt/net/secret.txt", "/", fake, {"/mnt/net"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LocusError::NotFound);
}

TEST_CASE("forbidden prefix is checked on the standardized path", "[resolver]") {
    FakeFilesystem fake;
    fake.files = {"/mnt/net/secret.txt"};
    // "/repo/../mnt/net/..." does not start with /mnt/net until standardized
    auto r = resolve_path("../mnt/net/secret.txt", "/repo", fake, {"/mnt/net"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LocusError::Forbidden);
    REQUIRE(fake.probed.size() == 1);
}

TEST_CASE("tilde stem resolves under HOME", "[resolver]") {
    ScopedHome home("/home/u");
    FakeFilesystem fake;
    fake.files = {"/home/u/notes.md"};
    auto r = resolve_path("~/notes.md", "/tmp", fake, {});
    REQUIRE(r.value() == "/home/u/notes.md");
}

// ===== Resolution against the real filesystem =====

TEST_CASE("resolve a real file in a temp directory", "[resolver]") {
    fs::path dir = fs::temp_directory_path() / ("locus_resolver_test_" + std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(dir / "src");
    std::ofstream(dir / "src" / "app.go") << "package main\n";

    LocalFilesystemPolicy policy(std::chrono::milliseconds(0));
    auto ok = resolve_path("./src/app.go", dir.string(), policy, {});
    auto missing = resolve_path("src/none.go", dir.string(), policy, {});
    auto ignored = resolve_path("src/app.go", dir.string(), policy, {(dir / "src").string()});

    std::error_code ec;
    fs::remove_all(dir, ec);

    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == (dir / "src" / "app.go").string());
    REQUIRE(missing.is_err());
    REQUIRE(ignored.is_err());
}
