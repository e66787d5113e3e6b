#ifndef ROUTEKIT_HTTP_UTIL_URL_HPP
#define ROUTEKIT_HTTP_UTIL_URL_HPP

#include <map>
#include <string>
#include <string_view>
#include <optional>

namespace routekit::http::util::url{

    /// percent-encode everything except RFC 3986 unreserved characters
    std::string url_encode(const std::string& value);

    /// like url_encode, but keeps '/' so a whole path can be encoded
    std::string uri_path_encode(const std::string& value);

    /// form decoding: percent escapes and '+' as space. Returns false on a malformed escape
    bool url_decode(const std::string& in, std::string& out);

    /// form decoding, empty string on a malformed escape
    std::string url_decode(const std::string& in);

    /// path segment decoding: percent escapes only, '+' is kept as is
    std::optional<std::string> percent_decode(std::string_view in);

    void parse_url_encoded_data(const std::string& data, std::multimap<std::string, std::string>& store);

    void parse_url_encoded_data(std::string::const_iterator& start, std::string::const_iterator& end, std::multimap<std::string, std::string>& store);

    std::string get_url_encoded_data(const std::multimap<std::string, std::string>& store);

}

#endif
