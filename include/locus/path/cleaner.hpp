#pragma once

#include <locus/executor.hpp>
#include <locus/result.hpp>
#include <locus/path/fs_policy.hpp>
#include <locus/path/locator.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace locus::path {

// Outcome of cleaning one token. clean_path is absent when the token does
// not name a local file; the locator fields are then absent too.
// column_number is only ever set together with line_number.
struct CleaningResult {
    std::optional<std::string> clean_path;
    std::optional<std::string> line_number;
    std::optional<std::string> column_number;

    bool found() const { return clean_path.has_value(); }
};

// What the terminal handed us
struct CleanRequest {
    std::string token;              // text believed to name a path
    std::string suffix;             // text right after it on the line
    std::string working_directory;  // absolute; anchors relative tokens
};

// If `token` starts with a diff "a/" or "b/" marker, the token without it.
std::optional<std::string> strip_diff_prefix(const std::string& token);

// Turns a token from terminal output into a verified local path plus an
// optional line/column.
//
// The token is stripped of enclosing brackets, trailing punctuation and a
// trailing locator, then resolved against the working directory. If that
// fails and the token carries a diff marker, the marker is removed and the
// whole attempt repeated once.
//
// The ignored-prefix list is copied at construction and the pattern table
// is shared-owned; instances share nothing else but the FilesystemPolicy,
// which must outlive them. A null table means the standard one.
class PathCleaner {
public:
    PathCleaner(CleanRequest request,
                FilesystemPolicy& policy,
                std::vector<std::string> ignored_prefixes,
                std::shared_ptr<const LocatorPatternTable> patterns = nullptr);

    // Blocking: probes the filesystem
    CleaningResult clean() const;

    const CleanRequest& request() const { return request_; }
    const std::vector<std::string>& ignored_prefixes() const { return ignored_prefixes_; }

private:
    Result<CleaningResult> attempt(const std::string& token) const;

    CleanRequest request_;
    FilesystemPolicy& policy_;
    std::vector<std::string> ignored_prefixes_;
    std::shared_ptr<const LocatorPatternTable> patterns_;
};

// Run cleaner->clean() on `worker`, then deliver the result exactly once by
// posting `completion` to `caller`.
void clean_async(std::shared_ptr<const PathCleaner> cleaner,
                 Executor& worker,
                 Executor& caller,
                 std::function<void(const CleaningResult&)> completion);

} // namespace locus::path
