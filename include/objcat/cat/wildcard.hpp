#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace objcat {

// How glob characters treat the '/' key separator
enum class WildcardMode {
    Segment,  // '*', '?' and classes never match '/'
    Flat      // keys are flat strings, '/' is an ordinary character
};

std::optional<WildcardMode> parse_wildcard_mode(const std::string& name);
const char* wildcard_mode_name(WildcardMode mode);

// Glob matcher over object keys.
//
// Pattern syntax:
//   *       any run of characters (including none)
//   ?       exactly one character
//   [abc]   one character from the set; ranges like [a-z]
//   [!abc]  one character not in the set ([^abc] is accepted too)
//   \c      the character c literally
//
// matches() is pure and total: a malformed pattern matches nothing.
class WildcardMatcher {
public:
    virtual ~WildcardMatcher() = default;

    virtual bool matches(std::string_view pattern, std::string_view key) const = 0;
    virtual WildcardMode mode() const = 0;
};

class SegmentWildcardMatcher final : public WildcardMatcher {
public:
    bool matches(std::string_view pattern, std::string_view key) const override;
    WildcardMode mode() const override { return WildcardMode::Segment; }
};

class FlatWildcardMatcher final : public WildcardMatcher {
public:
    bool matches(std::string_view pattern, std::string_view key) const override;
    WildcardMode mode() const override { return WildcardMode::Flat; }
};

std::unique_ptr<WildcardMatcher> make_wildcard_matcher(WildcardMode mode);

// True if s contains an unescaped '*', '?' or '['
bool has_glob(std::string_view s);

// s with every "\c" escape replaced by c; a trailing lone '\' is kept.
// "a\*b" -> "a*b"
std::string unescape_glob(std::string_view s);

// Literal text before the first glob character, escapes removed.
// "logs/2024-*.gz" -> "logs/2024-"
std::string glob_literal_prefix(std::string_view pattern);

// Empty when the pattern is well formed, otherwise the reason it is not
std::string validate_pattern(std::string_view pattern);

} // namespace objcat
