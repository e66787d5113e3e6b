#ifndef ROUTEKIT_HTTP_SERVER_REQUEST_HPP
#define ROUTEKIT_HTTP_SERVER_REQUEST_HPP

#include <any>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

#include "../common/http_request.hpp"

namespace routekit::http{

    /// Ordered list of path captures, as bound by the router
    using path_params = std::vector<std::pair<std::string, std::string>>;

    /**
     * Class that represents a single HTTP request while it travels through the endpoint chain. It
     * holds the original HTTP request, the path parameters captured while routing, the path as
     * seen by the current endpoint (mounted routers may strip their prefix), and request-scoped
     * data that middlewares use to pass values down to handlers.
     */
    class request{
    public:
        explicit request(std::shared_ptr<http_request> http_request);

        virtual ~request() = default;

    public:
        /// get parameter, empty string if not present
        const std::string& operator[](std::string_view param) const;

        /// get parameter, std::nullopt if not present
        std::optional<std::string> param(std::string_view name) const;

        /// has parameter
        bool has(std::string_view param) const;

        /// erase parameter
        bool erase(std::string_view param);

        std::string debug_parameters() const;

        void set_uri_parameter(const std::string& param, const std::string& value);

        void add_uri_parameters(const path_params& params);

        const path_params& get_uri_parameters() const;

        std::shared_ptr<http_request> get_http_request() const;

        method get_method() const;

        /// path as seen by the current endpoint
        const std::string& path() const;

        /// path as received, before any mount prefix was stripped
        const std::string& original_path() const;

        void set_path(std::string path);

        /// Get query parameter by key
        std::string query(const std::string& key) const;

        /// Get query parameter by key with default value
        std::string query(const std::string& key, const std::string& default_value) const;

        /// Get request body as string
        const std::string& body() const;

        /// Get request header by key
        const std::string& header(std::string_view key) const;

        void set_auth_user(const std::string& auth_user);

        const std::string& get_auth_user() const;

        /// store a request-scoped value, replacing a previous one of the same type
        template<typename T>
        void set_data(T value){
            data_[std::type_index(typeid(T))] = std::make_any<T>(std::move(value));
        }

        /// request-scoped value of type T, nullptr if none was stored
        template<typename T>
        const T* get_data() const{
            auto it = data_.find(std::type_index(typeid(T)));
            if(it == data_.end()) return nullptr;
            return std::any_cast<T>(&it->second);
        }

        template<typename T>
        T* get_data(){
            auto it = data_.find(std::type_index(typeid(T)));
            if(it == data_.end()) return nullptr;
            return std::any_cast<T>(&it->second);
        }

    private:
        /**
         * This is the request that originated the routed request, and required to know the body, the
         * content type, etc.
         */
        std::shared_ptr<http_request> http_request_;

        /**
         * Matched parameters found in the URL, like username, device, etc., in pattern order
         */
        path_params params_;

        std::string path_;

        std::string auth_user_;

        std::map<std::type_index, std::any> data_;
    };

}

#endif
