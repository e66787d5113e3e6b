#ifndef ROUTEKIT_HTTP_REQUEST_HPP
#define ROUTEKIT_HTTP_REQUEST_HPP

#include <map>
#include <string>
#include <string_view>
#include "headers.hpp"
#include "method.hpp"

namespace routekit::http{

    /**
     * Parsed HTTP request as handed over by the connection layer: method, request target, headers
     * and the (already read) body. Wire parsing is not done here.
     */
    class http_request : public headers{
    public:
        http_request() = default;
        http_request(method http_method, std::string uri);
        ~http_request() override = default;

        void set_method(method http_method);
        void set_method(std::string_view http_method);
        method get_method() const;

        /// sets the request target, splitting path and query string
        void set_uri(std::string uri);
        const std::string& get_uri() const;
        const std::string& get_path() const;
        const std::string& get_query() const;

        bool has_query_parameter(const std::string& key) const;
        const std::string& get_query_parameter(const std::string& key) const;
        const std::multimap<std::string, std::string>& get_query_parameters() const;

        void set_content(std::string content);
        void set_content(std::string content, std::string content_type);
        const std::string& get_body() const;
        std::string& get_body();

        void log(const char* scope) const override;

    private:
        method method_ = method::GET;
        std::string uri_ = "/";
        std::string path_ = "/";
        std::string query_;
        std::multimap<std::string, std::string> query_params_;
        std::string content_;
    };

}

#endif
