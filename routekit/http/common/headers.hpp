#ifndef ROUTEKIT_HTTP_HEADERS_HPP
#define ROUTEKIT_HTTP_HEADERS_HPP

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <optional>

namespace routekit::http{

    namespace header{
        constexpr std::string_view accept = "Accept";
        constexpr std::string_view allow = "Allow";
        constexpr std::string_view authorization = "Authorization";
        constexpr std::string_view content_length = "Content-Length";
        constexpr std::string_view content_type = "Content-Type";
        constexpr std::string_view host = "Host";
        constexpr std::string_view origin = "Origin";
        constexpr std::string_view user_agent = "User-Agent";
        constexpr std::string_view www_authenticate = "WWW-Authenticate";
        constexpr std::string_view access_control_allow_origin = "Access-Control-Allow-Origin";
        constexpr std::string_view access_control_allow_methods = "Access-Control-Allow-Methods";
        constexpr std::string_view access_control_allow_headers = "Access-Control-Allow-Headers";
        constexpr std::string_view access_control_allow_credentials = "Access-Control-Allow-Credentials";
        constexpr std::string_view access_control_max_age = "Access-Control-Max-Age";
        constexpr std::string_view access_control_request_method = "Access-Control-Request-Method";
        constexpr std::string_view access_control_request_headers = "Access-Control-Request-Headers";
        constexpr std::string_view vary = "Vary";
        constexpr std::string_view x_request_id = "X-Request-Id";
    }

    /**
     * Ordered, case-insensitive header list shared by requests and responses. Duplicated keys are
     * kept in insertion order.
     */
    class headers{
    public:
        using http_header = std::pair<std::string, std::string>;

        headers() = default;
        virtual ~headers() = default;

        void add_header(std::string key, std::string value);
        void set_header(std::string key, std::string value);
        void set(std::string key, std::string value) { set_header(std::move(key), std::move(value)); }
        bool remove_header(std::string_view key);

        bool has_header(std::string_view key) const;
        const std::string& get_header(std::string_view key) const;
        std::vector<std::string> get_headers_with_key(std::string_view key) const;
        const std::vector<http_header>& get_headers() const;
        std::vector<http_header>& get_headers();
        bool empty_headers() const;

        const std::string& get_authorization() const;
        const std::string& get_user_agent() const;
        const std::string& get_content_type() const;
        bool is_content_type(std::string_view value) const;

        /// parsed Content-Length, std::nullopt when absent or not a number
        std::optional<size_t> get_content_length() const;

        virtual void log(const char* scope) const;

    protected:
        static bool is_header(std::string_view key, std::string_view header);

        std::vector<http_header> headers_;
    };

}

#endif
