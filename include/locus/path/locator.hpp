#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace locus::path {

// Longest text the locator patterns are run against: a PATH_MAX path plus
// room for a locator. Longer input is treated as carrying no locator.
constexpr size_t kMaxTokenLength = 4096 + 64;

// Line and optional column as they appeared in the text. Digits are kept
// verbatim (leading zeros included); nothing is parsed to integers.
struct Locator {
    std::optional<std::string> line;
    std::optional<std::string> column;

    bool empty() const { return !line.has_value(); }
};

// One recognised locator notation. `arity` is the number of numeric
// capture groups (1 = line, 2 = line and column).
struct LocatorPattern {
    const char* name;
    const char* source;
    int arity;
};

// A locator found at the end of a token: the exact matched text plus the
// numbers it carried.
struct TrailingLocator {
    std::string text;
    Locator locator;
};

// The ordered table of locator notations. Order is significant: the first
// pattern that qualifies wins, so ":10:5" is read as line+column, never as
// ":10" followed by garbage.
class LocatorPatternTable {
public:
    // The built-in table:
    //   :L:C   :L   [L, C]   ", line L, column C   (L, C)
    static std::shared_ptr<const LocatorPatternTable> standard();

    explicit LocatorPatternTable(const std::vector<LocatorPattern>& patterns);

    // First pattern (in table order) matching a suffix that reaches the
    // very end of `text`. Text longer than kMaxTokenLength never matches.
    std::optional<TrailingLocator> match_anchored_at_end(const std::string& text) const;

    // First pattern (in table order) matching at the start of `text` and
    // consuming all of it. Text longer than kMaxTokenLength never matches.
    std::optional<Locator> match_whole(const std::string& text) const;

    size_t size() const { return entries_.size(); }
    const LocatorPattern& pattern(size_t i) const { return entries_[i].pattern; }

private:
    struct Entry {
        LocatorPattern pattern;
        std::regex at_end;
        std::regex at_start;
    };

    static Locator captures_to_locator(const std::smatch& m, int arity);

    std::vector<Entry> entries_;
};

// Read a standalone suffix (text following the token in the terminal) as a
// locator. Partial matches are rejected; an unmatched suffix yields an
// empty Locator.
Locator extract_locator(const std::string& suffix,
                        const LocatorPatternTable& table = *LocatorPatternTable::standard());

} // namespace locus::path
