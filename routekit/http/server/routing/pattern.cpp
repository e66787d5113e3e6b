#include "pattern.hpp"
#include "routing_error.hpp"
#include "../../util/url.hpp"
#include "../../../util/logger.hpp"

#include <algorithm>
#include <set>
#include <boost/algorithm/string.hpp>

namespace routekit::http {

namespace {

    int specificity(segment::kind kind, bool regex_precedence) {
        switch (kind) {
            case segment::kind::literal:       return 3;
            case segment::kind::capture_regex: return regex_precedence ? 2 : 1;
            case segment::kind::capture:       return 1;
            case segment::kind::wildcard:      return 0;
        }
        return 0;
    }

    segment parse_segment(std::string_view route, std::string_view piece, bool last) {
        if (piece.front() == '*') {
            if (!last) throw compile_error(std::string(route), "wildcard must be the last segment");
            return segment::make_wildcard(std::string(piece.substr(1)));
        }

        if (piece.front() == '<') {
            if (piece.size() < 2 || piece.back() != '>')
                throw compile_error(std::string(route), "unterminated regex in '" + std::string(piece) + "'");
            return segment::make_capture_regex({}, std::string(piece.substr(1, piece.size() - 2)));
        }

        if (piece.front() == ':') {
            auto open = piece.find('<');
            auto name = piece.substr(1, open == std::string_view::npos ? std::string_view::npos : open - 1);
            if (name.empty())
                throw compile_error(std::string(route), "capture without name in '" + std::string(piece) + "'");
            if (open == std::string_view::npos) {
                return segment::make_capture(std::string(name));
            }
            if (piece.back() != '>')
                throw compile_error(std::string(route), "unterminated regex in '" + std::string(piece) + "'");
            return segment::make_capture_regex(std::string(name),
                                               std::string(piece.substr(open + 1, piece.size() - open - 2)));
        }

        return segment::make_literal(decode_segment(piece));
    }

}

segment::segment(kind k, std::string name, std::string text) :
    kind_(k), name_(std::move(name)), text_(std::move(text)) {}

segment segment::make_literal(std::string text) {
    return segment(kind::literal, {}, std::move(text));
}

segment segment::make_capture(std::string name) {
    return segment(kind::capture, std::move(name), {});
}

segment segment::make_capture_regex(std::string name, std::string regex) {
    if (regex.empty()) {
        throw compile_error(name.empty() ? "<>" : ":" + name + "<>", "empty regex");
    }
    segment result(kind::capture_regex, std::move(name), regex);
    try {
        result.regex_ = std::make_shared<const boost::regex>(regex, boost::regex::ECMAScript);
    } catch (const boost::regex_error& e) {
        throw compile_error(result.str(), std::string("bad regex: ") + e.what());
    }
    return result;
}

segment segment::make_wildcard(std::string name) {
    return segment(kind::wildcard, std::move(name), {});
}

bool segment::matches(std::string_view decoded, bool ignore_case) const {
    switch (kind_) {
        case kind::literal:
            return ignore_case ? boost::algorithm::iequals(decoded, text_) : decoded == text_;
        case kind::capture_regex:
            try {
                return boost::regex_match(decoded.begin(), decoded.end(), *regex_);
            } catch (const std::runtime_error& e) {
                // the matcher gives up on inputs that exceed its complexity or memory limits
                LOG_WARNING("regex <{}> failed on a {} byte segment: {}", text_, decoded.size(), e.what());
                return false;
            }
        case kind::capture:
            return !decoded.empty();
        case kind::wildcard:
            return true;
    }
    return false;
}

std::string segment::str() const {
    switch (kind_) {
        case kind::literal:       return text_;
        case kind::capture_regex: return (name_.empty() ? "" : ":" + name_) + "<" + text_ + ">";
        case kind::capture:       return ":" + name_;
        case kind::wildcard:      return "*" + name_;
    }
    return {};
}

pattern::pattern(std::vector<segment> segments) : segments_(std::move(segments)) {}

pattern pattern::compile(std::string_view route) {
    if (route.empty()) throw compile_error("", "empty pattern");

    auto pieces = split_path(route);
    std::vector<segment> segments;
    segments.reserve(pieces.size());
    std::set<std::string> names;

    for (size_t i = 0; i < pieces.size(); ++i) {
        segments.push_back(parse_segment(route, pieces[i], i + 1 == pieces.size()));
        const auto& seg = segments.back();
        if (seg.binds() && !names.insert(seg.name()).second) {
            throw compile_error(std::string(route), "duplicated capture name '" + seg.name() + "'");
        }
    }

    return pattern(std::move(segments));
}

pattern pattern::concat(const pattern& prefix, const pattern& suffix) {
    if (prefix.has_wildcard() && !suffix.segments_.empty()) {
        throw registration_error("cannot append '" + suffix.str() + "' after wildcard prefix '" + prefix.str() + "'");
    }

    std::set<std::string> names;
    for (const auto& seg : prefix.segments_) {
        if (seg.binds()) names.insert(seg.name());
    }

    std::vector<segment> segments = prefix.segments_;
    for (const auto& seg : suffix.segments_) {
        if (seg.binds() && !names.insert(seg.name()).second) {
            throw registration_error("capture '" + seg.name() + "' in '" + suffix.str() +
                                     "' clashes with prefix '" + prefix.str() + "'");
        }
        segments.push_back(seg);
    }
    return pattern(std::move(segments));
}

bool pattern::has_wildcard() const {
    return !segments_.empty() && segments_.back().get_kind() == segment::kind::wildcard;
}

size_t pattern::literal_count() const {
    return std::count_if(segments_.begin(), segments_.end(), [](const segment& seg) {
        return seg.get_kind() == segment::kind::literal;
    });
}

size_t pattern::regex_count() const {
    return std::count_if(segments_.begin(), segments_.end(), [](const segment& seg) {
        return seg.get_kind() == segment::kind::capture_regex;
    });
}

std::optional<path_params> pattern::match(std::string_view path, bool ignore_case) const {
    return match(split_path(path), ignore_case);
}

std::optional<path_params> pattern::match(const std::vector<std::string_view>& path_segments, bool ignore_case) const {
    size_t fixed = has_wildcard() ? segments_.size() - 1 : segments_.size();
    if (path_segments.size() < fixed) return std::nullopt;
    if (!has_wildcard() && path_segments.size() != fixed) return std::nullopt;

    for (size_t i = 0; i < fixed; ++i) {
        if (!segments_[i].matches(decode_segment(path_segments[i]), ignore_case)) return std::nullopt;
    }

    return extract(path_segments);
}

path_params pattern::extract(const std::vector<std::string_view>& path_segments) const {
    path_params params;
    for (size_t i = 0; i < segments_.size(); ++i) {
        const auto& seg = segments_[i];
        if (!seg.binds()) continue;

        if (seg.get_kind() == segment::kind::wildcard) {
            std::string rest;
            for (size_t j = i; j < path_segments.size(); ++j) {
                if (j != i) rest += '/';
                rest += decode_segment(path_segments[j]);
            }
            params.emplace_back(seg.name(), std::move(rest));
        } else if (i < path_segments.size()) {
            params.emplace_back(seg.name(), decode_segment(path_segments[i]));
        }
    }
    return params;
}

std::string pattern::str() const {
    if (segments_.empty()) return "/";
    std::string result;
    for (const auto& seg : segments_) {
        result += '/';
        result += seg.str();
    }
    return result;
}

bool outranks(const pattern& a, const pattern& b, bool regex_precedence) {
    auto literals_a = a.literal_count();
    auto literals_b = b.literal_count();
    if (literals_a != literals_b) return literals_a > literals_b;

    if (regex_precedence) {
        auto regex_a = a.regex_count();
        auto regex_b = b.regex_count();
        if (regex_a != regex_b) return regex_a > regex_b;
    }

    const auto& sa = a.segments();
    const auto& sb = b.segments();
    for (size_t i = 0; i < sa.size() && i < sb.size(); ++i) {
        auto rank_a = specificity(sa[i].get_kind(), regex_precedence);
        auto rank_b = specificity(sb[i].get_kind(), regex_precedence);
        if (rank_a != rank_b) return rank_a > rank_b;
    }

    // equal ranks: regex captures first, then by regex source
    for (size_t i = 0; i < sa.size() && i < sb.size(); ++i) {
        bool regex_a = sa[i].get_kind() == segment::kind::capture_regex;
        bool regex_b = sb[i].get_kind() == segment::kind::capture_regex;
        if (regex_a != regex_b) return regex_a;
        if (regex_a && sa[i].text() != sb[i].text()) return sa[i].text() < sb[i].text();
    }

    // same prefix, so only a wildcard matching an empty remainder can make the lengths differ
    return !a.has_wildcard() && b.has_wildcard();
}

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> pieces;
    size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        if (end > start) pieces.push_back(path.substr(start, end - start));
        start = end + 1;
    }
    return pieces;
}

std::string decode_segment(std::string_view raw) {
    if (raw.find('%') == std::string_view::npos) return std::string(raw);
    auto decoded = util::url::percent_decode(raw);
    return decoded ? std::move(*decoded) : std::string(raw);
}

std::string strip_path(std::string_view path, const std::vector<bool>& stripped) {
    if (std::find(stripped.begin(), stripped.end(), true) == stripped.end()) {
        return std::string(path);
    }

    auto pieces = split_path(path);
    std::string result;
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (i < stripped.size() && stripped[i]) continue;
        result += '/';
        result.append(pieces[i].data(), pieces[i].size());
    }

    if (result.empty()) return "/";
    if (!path.empty() && path.back() == '/') result += '/';
    return result;
}

}
