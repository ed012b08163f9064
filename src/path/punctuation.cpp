#include <locus/path/punctuation.hpp>
#include <locus/log.hpp>

namespace locus::path {

namespace {

struct BracketPair {
    char open;
    char close;
};

constexpr BracketPair kBracketPairs[] = {
    {'(', ')'},
    {'<', '>'},
    {'[', ']'},
    {'{', '}'},
    {'\'', '\''},
    {'"', '"'},
};

bool is_trailing_punctuation(char c) {
    return c == '.' || c == ',' || c == ':';
}

} // namespace

std::string strip_enclosing_brackets(const std::string& s) {
    if (s.size() < 2) return s;
    for (const auto& pair : kBracketPairs) {
        if (s.front() == pair.open && s.back() == pair.close) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

std::optional<StrippedToken> strip_punctuation(const std::string& token,
                                               const LocatorPatternTable& table) {
    if (token.empty()) {
        log::debug("  no: it is empty");
        return std::nullopt;
    }
    if (token.size() > kMaxTokenLength) {
        log::debug("  no: token is %zu bytes long", token.size());
        return std::nullopt;
    }

    std::string path = strip_enclosing_brackets(token);

    if (!path.empty() && is_trailing_punctuation(path.back())) {
        path.pop_back();
    }

    StrippedToken out;
    if (auto loc = table.match_anchored_at_end(path)) {
        path.resize(path.size() - loc->text.size());
        out.stem = std::move(path);
        out.locator = std::move(*loc);
        return out;
    }

    // No trailing line/column number. Drop a trailing paren.
    if (!path.empty() && path.back() == ')') {
        path.pop_back();
    }

    out.stem = std::move(path);
    return out;
}

} // namespace locus::path
