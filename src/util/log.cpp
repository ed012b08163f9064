#include <locus/log.hpp>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace locus::log {

// Messages are written from worker threads as well as the main thread
static std::atomic<Level> s_level{Info};

// -1 until detected from the terminal or set explicitly, then 0 or 1
static std::atomic<int> s_color{-1};

static bool color_enabled() {
    int state = s_color.load();
    if (state < 0) {
        int detected = isatty(fileno(stderr)) ? 1 : 0;
        // An explicit set_color_enabled() that got there first wins
        if (s_color.compare_exchange_strong(state, detected)) state = detected;
    }
    return state == 1;
}

void set_level(Level lvl) {
    s_level.store(lvl);
}

Level get_level() {
    return s_level.load();
}

bool enabled(Level lvl) {
    return lvl >= s_level.load();
}

void set_color_enabled(bool enabled) {
    s_color.store(enabled ? 1 : 0);
}

bool is_color_enabled() {
    return color_enabled();
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return Result<Level>::ok(Trace);
    if (lower == "debug") return Result<Level>::ok(Debug);
    if (lower == "info") return Result<Level>::ok(Info);
    if (lower == "warn" || lower == "warning") return Result<Level>::ok(Warn);
    if (lower == "error") return Result<Level>::ok(Error);

    return LocusError{LocusError::Config,
        "unknown log level: '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

bool init_from_env() {
    const char* env = std::getenv("LOCUS_LOG");
    if (!env || !*env) return true;

    auto lvl = parse_level(env);
    if (lvl.is_err()) return false;
    set_level(lvl.value());
    return true;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static const char* reset_color() {
    return "\033[0m";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;

    if (color_enabled()) {
        std::fprintf(stderr, "%s%s%s: ", level_color(lvl), level_name(lvl), reset_color());
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }

    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace locus::log
