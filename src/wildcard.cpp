#include "objcat/cat/wildcard.hpp"
#include "objcat/core/constants.hpp"

#include <utility>
#include <vector>

namespace objcat {

namespace {

enum class TokenType { Literal, AnyChar, Star, Class };

struct Token {
    TokenType type = TokenType::Literal;
    char literal = 0;
    bool negated = false;
    std::vector<std::pair<unsigned char, unsigned char>> ranges;  // inclusive
};

// Split a pattern into tokens. Returns an error message on malformed input.
std::string tokenize(std::string_view pattern, std::vector<Token>& tokens) {
    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];
        Token token;

        if (c == '\\') {
            if (i + 1 >= pattern.size()) {
                return "trailing escape character";
            }
            token.literal = pattern[i + 1];
            i += 2;
        } else if (c == '*') {
            token.type = TokenType::Star;
            ++i;
            // Collapse runs of stars
            if (!tokens.empty() && tokens.back().type == TokenType::Star) {
                continue;
            }
        } else if (c == '?') {
            token.type = TokenType::AnyChar;
            ++i;
        } else if (c == '[') {
            token.type = TokenType::Class;
            size_t j = i + 1;
            if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) {
                token.negated = true;
                ++j;
            }
            bool first = true;
            bool closed = false;
            while (j < pattern.size()) {
                char lo = pattern[j];
                // ']' right after the opening bracket is a member, not the end
                if (lo == ']' && !first) {
                    closed = true;
                    ++j;
                    break;
                }
                first = false;
                if (lo == '\\') {
                    if (j + 1 >= pattern.size()) {
                        return "trailing escape character";
                    }
                    lo = pattern[++j];
                }
                ++j;
                char hi = lo;
                if (j + 1 < pattern.size() && pattern[j] == '-' && pattern[j + 1] != ']') {
                    hi = pattern[j + 1];
                    j += 2;
                    if (hi == '\\') {
                        if (j >= pattern.size()) {
                            return "trailing escape character";
                        }
                        hi = pattern[j++];
                    }
                    if (static_cast<unsigned char>(hi) < static_cast<unsigned char>(lo)) {
                        return std::string("invalid character range ") + lo + "-" + hi;
                    }
                }
                token.ranges.emplace_back(static_cast<unsigned char>(lo),
                                          static_cast<unsigned char>(hi));
            }
            if (!closed) {
                return "unterminated character class";
            }
            i = j;
        } else {
            token.literal = c;
            ++i;
        }

        tokens.push_back(std::move(token));
    }
    return "";
}

bool token_matches(const Token& token, char c, bool cross_separator) {
    switch (token.type) {
        case TokenType::Literal:
            return token.literal == c;
        case TokenType::AnyChar:
            return cross_separator || c != constants::KEY_SEPARATOR;
        case TokenType::Class: {
            if (!cross_separator && c == constants::KEY_SEPARATOR) {
                return false;
            }
            auto uc = static_cast<unsigned char>(c);
            bool in_set = false;
            for (const auto& [lo, hi] : token.ranges) {
                if (uc >= lo && uc <= hi) {
                    in_set = true;
                    break;
                }
            }
            return in_set != token.negated;
        }
        case TokenType::Star:
            break;
    }
    return false;
}

// Dynamic programming over (token, key position); linear memory, no
// exponential backtracking on patterns with many stars.
bool match_glob(std::string_view pattern, std::string_view key, bool cross_separator) {
    std::vector<Token> tokens;
    if (!tokenize(pattern, tokens).empty()) {
        return false;
    }

    const size_t n = key.size();
    // next[j]: tokens[i+1..] match key[j..]
    std::vector<char> next(n + 1, 0);
    std::vector<char> cur(n + 1, 0);
    next[n] = 1;

    for (size_t i = tokens.size(); i-- > 0;) {
        const Token& token = tokens[i];
        for (size_t j = n + 1; j-- > 0;) {
            if (token.type == TokenType::Star) {
                bool extend = j < n &&
                              (cross_separator || key[j] != constants::KEY_SEPARATOR) &&
                              cur[j + 1];
                cur[j] = next[j] || extend;
            } else {
                cur[j] = j < n && token_matches(token, key[j], cross_separator) && next[j + 1];
            }
        }
        std::swap(cur, next);
    }

    return next[0] != 0;
}

}  // namespace

std::optional<WildcardMode> parse_wildcard_mode(const std::string& name) {
    if (name == "segment") return WildcardMode::Segment;
    if (name == "flat") return WildcardMode::Flat;
    return std::nullopt;
}

const char* wildcard_mode_name(WildcardMode mode) {
    return mode == WildcardMode::Flat ? "flat" : "segment";
}

bool SegmentWildcardMatcher::matches(std::string_view pattern, std::string_view key) const {
    return match_glob(pattern, key, false);
}

bool FlatWildcardMatcher::matches(std::string_view pattern, std::string_view key) const {
    return match_glob(pattern, key, true);
}

std::unique_ptr<WildcardMatcher> make_wildcard_matcher(WildcardMode mode) {
    if (mode == WildcardMode::Flat) {
        return std::make_unique<FlatWildcardMatcher>();
    }
    return std::make_unique<SegmentWildcardMatcher>();
}

bool has_glob(std::string_view s) {
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '\\') {
            ++i;
            continue;
        }
        if (c == '*' || c == '?' || c == '[') {
            return true;
        }
    }
    return false;
}

std::string glob_literal_prefix(std::string_view pattern) {
    std::string prefix;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\') {
            if (i + 1 < pattern.size()) {
                prefix += pattern[++i];
            }
            continue;
        }
        if (c == '*' || c == '?' || c == '[') {
            break;
        }
        prefix += c;
    }
    return prefix;
}

std::string unescape_glob(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            ++i;
        }
        out += s[i];
    }
    return out;
}

std::string validate_pattern(std::string_view pattern) {
    std::vector<Token> tokens;
    return tokenize(pattern, tokens);
}

} // namespace objcat
