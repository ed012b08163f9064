#include <locus/path/cleaner.hpp>
#include <locus/path/punctuation.hpp>
#include <locus/path/resolver.hpp>
#include <locus/log.hpp>

namespace locus::path {

std::optional<std::string> strip_diff_prefix(const std::string& token) {
    if (token.size() >= 2 && (token[0] == 'a' || token[0] == 'b') && token[1] == '/') {
        return token.substr(2);
    }
    return std::nullopt;
}

PathCleaner::PathCleaner(CleanRequest request,
                         FilesystemPolicy& policy,
                         std::vector<std::string> ignored_prefixes,
                         std::shared_ptr<const LocatorPatternTable> patterns)
    : request_(std::move(request)),
      policy_(policy),
      ignored_prefixes_(std::move(ignored_prefixes)),
      patterns_(patterns ? std::move(patterns) : LocatorPatternTable::standard()) {}

Result<CleaningResult> PathCleaner::attempt(const std::string& token) const {
    auto stripped = strip_punctuation(token, *patterns_);
    if (!stripped) {
        return LocusError{LocusError::InvalidArg, "token is empty"};
    }

    CleaningResult result;

    // A locator cut off the token takes precedence over the suffix
    const std::string& locator_text =
        stripped->locator ? stripped->locator->text : request_.suffix;
    Locator loc = extract_locator(locator_text, *patterns_);
    result.line_number = std::move(loc.line);
    result.column_number = std::move(loc.column);

    auto full = resolve_path(stripped->stem, request_.working_directory,
                             policy_, ignored_prefixes_);
    if (full.is_err()) return std::move(full).error();

    result.clean_path = std::move(full).value();
    return Result<CleaningResult>::ok(std::move(result));
}

CleaningResult PathCleaner::clean() const {
    auto direct = attempt(request_.token);
    if (direct.is_ok()) return std::move(direct).value();

    auto stripped = strip_diff_prefix(request_.token);
    if (!stripped) {
        log::debug("  not a path: %s", direct.error().message.c_str());
        return CleaningResult{};
    }

    log::debug("  Treating as diff path");
    auto retry = attempt(*stripped);
    if (retry.is_ok()) return std::move(retry).value();

    log::debug("  not a path: %s", retry.error().message.c_str());
    return CleaningResult{};
}

void clean_async(std::shared_ptr<const PathCleaner> cleaner,
                 Executor& worker,
                 Executor& caller,
                 std::function<void(const CleaningResult&)> completion) {
    worker.post([cleaner, &caller, completion]() {
        CleaningResult result = cleaner->clean();
        caller.post([completion, result]() { completion(result); });
    });
}

} // namespace locus::path
