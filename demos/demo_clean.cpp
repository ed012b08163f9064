// demo_clean.cpp
//
// Resolve a token copied from terminal output to a local file, the way a
// terminal does when the user clicks on it.
//
//     ./locus_clean --cwd /repo 'src/main.c:10:5'
//     ./locus_clean --cwd /repo --suffix '", line 3, column 7' notes.md
//     ./locus_clean --cwd /repo --async -v a/src/app.go:42
//
// Prints path[:line[:column]] and exits 0 when the token names a local
// file, exits 1 when it does not, and 2 on bad arguments or configuration.

#include <locus/config.hpp>
#include <locus/executor.hpp>
#include <locus/log.hpp>
#include <locus/path/cleaner.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using namespace locus;

struct Options {
    path::CleanRequest request;
    std::string config_file;
    bool verbose = false;
    bool async = false;
};

static const char* kUsage =
    "usage: locus_clean [--cwd DIR] [--suffix TEXT] [--config FILE] [--async] [-v] TOKEN";

static Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    bool have_token = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto need_value = [&](const char* flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return LocusError{LocusError::InvalidArg,
                    std::string(flag) + " needs a value", kUsage};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (arg == "--cwd") {
            auto v = need_value("--cwd");
            LOCUS_TRY(v);
            opts.request.working_directory = v.value();
        } else if (arg == "--suffix") {
            auto v = need_value("--suffix");
            LOCUS_TRY(v);
            opts.request.suffix = v.value();
        } else if (arg == "--config") {
            auto v = need_value("--config");
            LOCUS_TRY(v);
            opts.config_file = v.value();
        } else if (arg == "--async") {
            opts.async = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (!have_token) {
            // The token may legitimately be empty or start with '-'
            opts.request.token = arg;
            have_token = true;
        } else {
            return LocusError{LocusError::InvalidArg,
                "unexpected argument: " + arg, kUsage};
        }
    }

    if (!have_token) {
        return LocusError{LocusError::InvalidArg, "no token given", kUsage};
    }

    if (opts.request.working_directory.empty()) {
        std::error_code ec;
        opts.request.working_directory = fs::current_path(ec).string();
        if (ec) {
            return LocusError{LocusError::IO,
                "cannot determine current directory: " + ec.message(),
                "pass --cwd explicitly"};
        }
    }

    return Result<Options>::ok(std::move(opts));
}

static path::CleaningResult run_async(std::shared_ptr<const path::PathCleaner> cleaner) {
    SerialQueue worker;
    ManualExecutor main_loop;
    path::CleaningResult out;
    bool done = false;

    path::clean_async(std::move(cleaner), worker, main_loop,
                      [&](const path::CleaningResult& r) {
                          out = r;
                          done = true;
                      });

    while (!done) {
        main_loop.wait_and_run(std::chrono::milliseconds(50));
    }
    return out;
}

int main(int argc, char** argv) {
    if (!log::init_from_env()) {
        log::warn("ignoring unknown LOCUS_LOG level");
    }

    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 2;
    }

    auto cfg = load_effective_config(opts.value().config_file);
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 2;
    }

    if (cfg.value().log_level) log::set_level(*cfg.value().log_level);
    if (opts.value().verbose) log::set_level(log::Debug);

    log::debug("%zu ignored prefix(es), probe interval %lld ms",
               cfg.value().ignored_prefixes.size(),
               static_cast<long long>(cfg.value().probe_interval.count()));

    path::LocalFilesystemPolicy policy(cfg.value().probe_interval);
    auto cleaner = std::make_shared<path::PathCleaner>(
        opts.value().request, policy, cfg.value().ignored_prefixes);

    path::CleaningResult result = opts.value().async
        ? run_async(cleaner)
        : cleaner->clean();

    if (!result.found()) {
        log::info("not a local path: %s", opts.value().request.token.c_str());
        return 1;
    }

    std::cout << *result.clean_path;
    if (result.line_number) {
        std::cout << ":" << *result.line_number;
        if (result.column_number) std::cout << ":" << *result.column_number;
    }
    std::cout << "\n";
    return 0;
}
