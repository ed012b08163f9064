#pragma once

#include <locus/result.hpp>
#include <locus/path/fs_policy.hpp>
#include <string>
#include <vector>

namespace locus::path {

// Expand a leading "~" or "~user". Paths without one, or naming an unknown
// user, come back unchanged. Trailing slashes are removed (except "/").
std::string expand_tilde(const std::string& path);

// Lexically resolve "." and ".." segments of an absolute path. Symlinks
// are not followed.
std::string standardize_path(const std::string& path);

// Turn a stripped path stem into an absolute, standardized path that exists
// locally and is not under a forbidden prefix.
//
// Errors:
//   InvalidArg  empty stem, stem expanding to nothing, or no working
//               directory to anchor a relative stem
//   NotFound    nothing exists locally at the candidate
//   Forbidden   the standardized path falls under a forbidden prefix
Result<std::string> resolve_path(const std::string& stem,
                                 const std::string& working_directory,
                                 FilesystemPolicy& policy,
                                 const std::vector<std::string>& ignored_prefixes);

} // namespace locus::path
