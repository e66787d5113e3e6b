#ifndef ROUTEKIT_HTTP_ROUTE_PATTERN_HPP
#define ROUTEKIT_HTTP_ROUTE_PATTERN_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/regex.hpp>

#include "../request.hpp"

namespace routekit::http {

// Route pattern syntax, one segment per '/'-separated piece:
//
// 1. Literal:                    /api/v1/users
//
// 2. Capture, any single segment: /users/:user/devices/:device
//
// 3. Capture with a regex, the whole segment must match:
//    Example: "/users/:id<[0-9]+>"
//    A bare "<regex>" matches without binding a parameter: "/files/<[a-z]+>"
//
// 4. Trailing wildcard, captures the rest of the path including '/':
//    Example: "/files/*path"    ("*" alone matches without binding)
//
// Empty pieces are ignored, so "/a//b/" and "/a/b" are the same pattern. Segments are compared
// after percent-decoding. A regex cannot contain '/'.
//
// Common regexes:
#define ROUTEKIT_ID_PATTERN      "[0-9]+"                      // Numeric ID
#define ROUTEKIT_ALPHANUM_ID     "[a-zA-Z0-9_-]{1,32}"        // Alphanumeric ID (1-32 chars)
#define ROUTEKIT_UUID_PATTERN    "[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}"
#define ROUTEKIT_SLUG_PATTERN    "[a-z0-9]+(?:-[a-z0-9]+)*"   // URL-friendly slug

class segment {
public:
    // declared from most to least specific
    enum class kind {
        literal,
        capture_regex,
        capture,
        wildcard
    };

    static segment make_literal(std::string text);
    static segment make_capture(std::string name);
    static segment make_capture_regex(std::string name, std::string regex);
    static segment make_wildcard(std::string name);

    kind get_kind() const { return kind_; }

    /// capture name, empty for literals and anonymous captures
    const std::string& name() const { return name_; }

    /// literal text or regex source
    const std::string& text() const { return text_; }

    bool binds() const { return kind_ != kind::literal && !name_.empty(); }

    /// test a single, already decoded, path segment (wildcards accept anything)
    bool matches(std::string_view decoded, bool ignore_case = false) const;

    /// canonical pattern form of this segment
    std::string str() const;

private:
    segment(kind k, std::string name, std::string text);

    kind kind_ = kind::literal;
    std::string name_;
    std::string text_;
    std::shared_ptr<const boost::regex> regex_;
};

/**
 * Compiled route pattern. Immutable once compiled and cheap to copy (regexes are shared).
 */
class pattern {
public:
    /// the root pattern "/"
    pattern() = default;

    /// throws compile_error, "/" is the root pattern and "" is an error
    static pattern compile(std::string_view route);

    /// prefix + suffix as a single pattern, throws registration_error on a capture name clash
    static pattern concat(const pattern& prefix, const pattern& suffix);

    const std::vector<segment>& segments() const { return segments_; }
    bool has_wildcard() const;
    size_t literal_count() const;
    size_t regex_count() const;

    /// try to match a request path, returning the decoded captures on success
    std::optional<path_params> match(std::string_view path, bool ignore_case = false) const;

    /// same as above, with the path already split
    std::optional<path_params> match(const std::vector<std::string_view>& path_segments, bool ignore_case = false) const;

    /// bind capture names to a path already known to match this pattern's shape
    path_params extract(const std::vector<std::string_view>& path_segments) const;

    /// canonical form, i.e., "/users/:id<[0-9]+>/*rest"
    std::string str() const;

private:
    explicit pattern(std::vector<segment> segments);

    std::vector<segment> segments_;
};

/**
 * Whether a must be preferred over b when both match the same path:
 * 1. more literal segments
 * 2. more regex captures (only with regex_precedence)
 * 3. first differing segment, left to right, literal > regex > capture > wildcard
 * 4. first position where only one is a regex capture, or where the regex sources differ (byte order)
 * 5. no wildcard over a wildcard matching nothing
 */
bool outranks(const pattern& a, const pattern& b, bool regex_precedence = true);

/// split a path on '/', dropping empty pieces
std::vector<std::string_view> split_path(std::string_view path);

/// percent-decode a path segment, falling back to the raw text on malformed escapes
std::string decode_segment(std::string_view raw);

/// remove the selected segments from path, keeping a trailing slash if present
std::string strip_path(std::string_view path, const std::vector<bool>& stripped);

} // namespace routekit::http

#endif // ROUTEKIT_HTTP_ROUTE_PATTERN_HPP
