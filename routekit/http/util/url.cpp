#include "url.hpp"

#include <algorithm>
#include <cctype>

namespace routekit::http::util::url{

    namespace {
        constexpr char hex_chars[] = "0123456789ABCDEF";

        inline int hex_digit(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        inline bool is_unreserved(char c) {
            return std::isalnum(static_cast<unsigned char>(c))
                || c == '-' || c == '_' || c == '.' || c == '~';
        }

        std::string encode(const std::string& value, bool keep_slash) {
            std::string result;
            result.reserve(value.size() + value.size() / 4);

            for (unsigned char c : value) {
                if (is_unreserved(c) || (keep_slash && c == '/')) {
                    result += static_cast<char>(c);
                } else {
                    result += '%';
                    result += hex_chars[c >> 4];
                    result += hex_chars[c & 0x0F];
                }
            }
            return result;
        }

        bool decode(std::string_view in, std::string& out, bool plus_as_space) {
            out.clear();
            out.reserve(in.size());

            for (size_t i = 0; i < in.size(); ++i) {
                if (in[i] == '%') {
                    if (i + 2 >= in.size()) return false;
                    int hi = hex_digit(in[i + 1]);
                    int lo = hex_digit(in[i + 2]);
                    if (hi < 0 || lo < 0) return false;
                    out += static_cast<char>((hi << 4) | lo);
                    i += 2;
                } else if (plus_as_space && in[i] == '+') {
                    out += ' ';
                } else {
                    out += in[i];
                }
            }
            return true;
        }
    }

    // RFC 3986 Section 2.3: unreserved characters are not percent-encoded
    std::string url_encode(const std::string& value) {
        return encode(value, false);
    }

    std::string uri_path_encode(const std::string& value) {
        return encode(value, true);
    }

    bool url_decode(const std::string& in, std::string& out) {
        return decode(in, out, true);
    }

    std::string url_decode(const std::string& in) {
        std::string out;
        if (url_decode(in, out)) {
            return out;
        }
        return {};
    }

    std::optional<std::string> percent_decode(std::string_view in) {
        // fast path, nothing to decode
        if (in.find('%') == std::string_view::npos) {
            return std::string(in);
        }
        std::string out;
        if (!decode(in, out, false)) {
            return std::nullopt;
        }
        return out;
    }

    void parse_url_encoded_data(const std::string& data, std::multimap<std::string, std::string>& store) {
        auto start = data.cbegin();
        auto end = data.cend();
        parse_url_encoded_data(start, end, store);
    }

    void parse_url_encoded_data(std::string::const_iterator& start, std::string::const_iterator& end, std::multimap<std::string, std::string>& store) {
        if (start == end) return;

        auto it = start;
        while (it != end) {
            auto pair_end = std::find(it, end, '&');
            auto eq_pos = std::find(it, pair_end, '=');

            std::string key(it, eq_pos);
            std::string value;
            if (eq_pos != pair_end) {
                value.assign(eq_pos + 1, pair_end);
            }

            if (!key.empty()) {
                store.emplace(url_decode(key), url_decode(value));
            }

            it = (pair_end != end) ? pair_end + 1 : end;
        }

        start = it;
    }

    std::string get_url_encoded_data(const std::multimap<std::string, std::string>& store) {
        std::string result;
        bool first = true;
        for (const auto& [key, value] : store) {
            if (!first) result += '&';
            result += url_encode(key);
            result += '=';
            result += url_encode(value);
            first = false;
        }
        return result;
    }

}
