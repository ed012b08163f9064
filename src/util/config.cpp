#include <locus/config.hpp>
#include <toml++/toml.hpp>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace locus {

static std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split_prefix_list(const std::string& csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t comma = csv.find(',', start);
        if (comma == std::string::npos) comma = csv.size();
        auto entry = trim(csv.substr(start, comma - start));
        if (!entry.empty()) out.push_back(std::move(entry));
        start = comma + 1;
    }
    return out;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        LocusError err{LocusError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
        err.line = static_cast<int>(e.source().begin.line);
        return err;
    }

    Config cfg;

    // [paths] section: ignore is either "a,b,c" or ["a", "b", "c"]
    if (auto paths = doc["paths"].as_table()) {
        auto ignore = (*paths)["ignore"];
        if (auto s = ignore.value<std::string>()) {
            cfg.ignored_prefixes = split_prefix_list(*s);
            cfg.ignored_prefixes_set = true;
        } else if (auto arr = ignore.as_array()) {
            for (const auto& el : *arr) {
                auto s = el.value<std::string>();
                if (!s) {
                    return LocusError{LocusError::Config,
                        "paths.ignore entries must be strings"};
                }
                auto entry = trim(*s);
                if (!entry.empty()) cfg.ignored_prefixes.push_back(std::move(entry));
            }
            cfg.ignored_prefixes_set = true;
        } else if (ignore) {
            return LocusError{LocusError::Config,
                "paths.ignore must be a string or an array of strings"};
        }
    }

    // [probe] section
    if (auto probe = doc["probe"].as_table()) {
        if (auto v = (*probe)["interval-ms"].value<int64_t>()) {
            if (*v < 0) {
                return LocusError{LocusError::Config,
                    "probe.interval-ms must not be negative",
                    "use 0 to disable probe throttling"};
            }
            cfg.probe_interval = std::chrono::milliseconds(*v);
            cfg.probe_interval_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LocusError{LocusError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    // Prefix list is replaced as a whole, never concatenated
    if (other.ignored_prefixes_set) {
        ignored_prefixes = other.ignored_prefixes;
        ignored_prefixes_set = true;
    }
    if (other.probe_interval_set) {
        probe_interval = other.probe_interval;
        probe_interval_set = true;
    }
    if (other.log_level.has_value()) {
        log_level = other.log_level;
    }
}

void Config::apply_env() {
    const char* env = std::getenv("LOCUS_PATHS_TO_IGNORE");
    if (!env) return;
    ignored_prefixes = split_prefix_list(env);
    ignored_prefixes_set = true;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.locus/config.toml";
}

Result<Config> load_effective_config(const std::string& local_path) {
    std::optional<Config> global;
    auto global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && std::filesystem::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        if (g.is_err()) return std::move(g).error();
        global = std::move(g).value();
    }

    std::optional<Config> local;
    if (!local_path.empty()) {
        auto l = Config::load(local_path);
        if (l.is_err()) return std::move(l).error();
        local = std::move(l).value();
    }

    auto cfg = Config::effective(global, local);
    cfg.apply_env();
    return Result<Config>::ok(std::move(cfg));
}

} // namespace locus
