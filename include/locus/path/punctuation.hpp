#pragma once

#include <locus/path/locator.hpp>
#include <optional>
#include <string>

namespace locus::path {

struct StrippedToken {
    std::string stem;
    // Exact trailing text recognised as a locator, if any
    std::optional<TrailingLocator> locator;
};

// Remove one enclosing (), <>, [], {}, '' or "" pair if the whole string is
// wrapped in it. Strings shorter than two characters are returned as-is.
std::string strip_enclosing_brackets(const std::string& s);

// Reduce a raw terminal token to a path stem:
//   1. drop one enclosing bracket/quote pair
//   2. drop one trailing '.', ',' or ':'
//   3. cut a trailing locator (first match in table order), or
//   4. failing that, drop a single trailing ')'
// Returns nullopt for an empty token or one longer than kMaxTokenLength.
std::optional<StrippedToken> strip_punctuation(
    const std::string& token,
    const LocatorPatternTable& table = *LocatorPatternTable::standard());

} // namespace locus::path
