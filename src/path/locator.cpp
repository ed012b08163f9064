#include <locus/path/locator.hpp>
#include <locus/log.hpp>

namespace locus::path {

static const std::vector<LocatorPattern>& builtin_patterns() {
    static const std::vector<LocatorPattern> patterns = {
        {"colon-line-column",  R"(:(\d+):(\d+))",                  2},
        {"colon-line",         R"(:(\d+))",                        1},
        {"bracketed",          R"(\[(\d+), ?(\d+)\])",             2},
        {"quoted-line-column", R"(", line (\d+), column (\d+))",   2},
        {"parenthesized",      R"(\((\d+), ?(\d+)\))",             2},
    };
    return patterns;
}

std::shared_ptr<const LocatorPatternTable> LocatorPatternTable::standard() {
    static const std::shared_ptr<const LocatorPatternTable> table =
        std::make_shared<LocatorPatternTable>(builtin_patterns());
    return table;
}

LocatorPatternTable::LocatorPatternTable(const std::vector<LocatorPattern>& patterns) {
    entries_.reserve(patterns.size());
    for (const auto& p : patterns) {
        std::string src(p.source);
        entries_.push_back(Entry{
            p,
            std::regex(src + "$", std::regex::ECMAScript),
            std::regex("^" + src, std::regex::ECMAScript),
        });
    }
}

Locator LocatorPatternTable::captures_to_locator(const std::smatch& m, int arity) {
    Locator loc;
    if (arity >= 1 && m.size() > 1 && m[1].matched) {
        loc.line = m[1].str();
    }
    // Column is only ever set alongside a line from the same match
    if (arity >= 2 && loc.line && m.size() > 2 && m[2].matched) {
        loc.column = m[2].str();
    }
    return loc;
}

std::optional<TrailingLocator> LocatorPatternTable::match_anchored_at_end(
    const std::string& text) const
{
    // std::regex recurses per character matched; keep runaway digit runs out
    if (text.size() > kMaxTokenLength) return std::nullopt;

    for (const auto& e : entries_) {
        std::smatch m;
        if (!std::regex_search(text, m, e.at_end)) continue;

        TrailingLocator found;
        found.text = m[0].str();
        found.locator = captures_to_locator(m, e.pattern.arity);
        log::trace("  trailing locator '%s' matches %s",
                   found.text.c_str(), e.pattern.name);
        return found;
    }
    return std::nullopt;
}

std::optional<Locator> LocatorPatternTable::match_whole(const std::string& text) const {
    if (text.size() > kMaxTokenLength) return std::nullopt;

    for (const auto& e : entries_) {
        std::smatch m;
        if (!std::regex_search(text, m, e.at_start)) continue;
        // If part of the text would remain, this pattern can't be used
        if (static_cast<size_t>(m.length(0)) < text.size()) continue;

        log::debug("  suffix '%s' matches %s", text.c_str(), e.pattern.name);
        return captures_to_locator(m, e.pattern.arity);
    }
    return std::nullopt;
}

Locator extract_locator(const std::string& suffix, const LocatorPatternTable& table) {
    auto loc = table.match_whole(suffix);
    if (!loc) return Locator{};
    return *loc;
}

} // namespace locus::path
