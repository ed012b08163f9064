#include <catch2/catch.hpp>
#include <locus/path/fs_policy.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace locus;
using namespace locus::path;
namespace fs = std::filesystem;

namespace {

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("locus_fs_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string touch(const std::string& rel) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << "x\n";
        return full.string();
    }
};

} // namespace

// ===== Prefix checks =====

TEST_CASE("starts_with_any matches plain string prefixes", "[fs_policy]") {
    std::vector<std::string> prefixes = {"/mnt/net", "/srv"};
    REQUIRE(starts_with_any("/mnt/net/secret.txt", prefixes));
    REQUIRE(starts_with_any("/srv", prefixes));
    REQUIRE_FALSE(starts_with_any("/mnt/local/a", prefixes));
    REQUIRE_FALSE(starts_with_any("/mnt", prefixes));
}

TEST_CASE("empty prefixes never match", "[fs_policy]") {
    REQUIRE_FALSE(starts_with_any("/anything", {""}));
    REQUIRE_FALSE(starts_with_any("/anything", {}));
}

TEST_CASE("built-in network roots are forbidden", "[fs_policy]") {
    LocalFilesystemPolicy policy(std::chrono::milliseconds(0));
    REQUIRE(policy.has_forbidden_prefix("/net/host/share/a.c", {}));
    REQUIRE(policy.has_forbidden_prefix("/Network/Servers/x", {}));
    REQUIRE_FALSE(policy.has_forbidden_prefix("/home/u/a.c", {}));
    REQUIRE(policy.has_forbidden_prefix("/home/u/a.c", {"/home/u"}));
}

// ===== Existence =====

TEST_CASE("existing local file is found", "[fs_policy]") {
    TempDir tmp;
    auto file = tmp.touch("src/main.c");
    LocalFilesystemPolicy policy(std::chrono::milliseconds(0));
    REQUIRE(policy.exists_locally(file, {}));
    REQUIRE(policy.exists_locally(tmp.path.string(), {}));
}

TEST_CASE("missing file is not found", "[fs_policy]") {
    TempDir tmp;
    LocalFilesystemPolicy policy(std::chrono::milliseconds(0));
    REQUIRE_FALSE(policy.exists_locally((tmp.path / "nope.c").string(), {}));
}

TEST_CASE("existing file under an ignored prefix is not local", "[fs_policy]") {
    TempDir tmp;
    auto file = tmp.touch("share/secret.txt");
    LocalFilesystemPolicy policy(std::chrono::milliseconds(0));
    REQUIRE_FALSE(policy.exists_locally(file, {(tmp.path / "share").string()}));
    REQUIRE(policy.exists_locally(file, {"", "/definitely/elsewhere"}));
}

TEST_CASE("is_network_filesystem on a temp dir", "[fs_policy]") {
    TempDir tmp;
    auto r = is_network_filesystem(tmp.path.string());
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value());
}

TEST_CASE("is_network_filesystem reports unqueryable paths", "[fs_policy]") {
    auto r = is_network_filesystem("/nonexistent/locus/path");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LocusError::IO);
}

// ===== Throttling =====

TEST_CASE("probes are spaced by the probe interval", "[fs_policy]") {
    TempDir tmp;
    auto file = tmp.touch("a.txt");
    LocalFilesystemPolicy policy(std::chrono::milliseconds(40));
    REQUIRE(policy.probe_interval() == std::chrono::milliseconds(40));

    auto start = std::chrono::steady_clock::now();
    REQUIRE(policy.exists_locally(file, {}));
    REQUIRE(policy.exists_locally(file, {}));
    REQUIRE(policy.exists_locally(file, {}));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(elapsed >= std::chrono::milliseconds(80));
}

TEST_CASE("zero interval disables throttling", "[fs_policy]") {
    LocalFilesystemPolicy policy(std::chrono::milliseconds(0));
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 10; ++i) {
        REQUIRE_FALSE(policy.exists_locally("/nonexistent/locus/x", {}));
    }
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
}
