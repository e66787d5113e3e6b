#include "method.hpp"

namespace routekit::http{

    namespace method_strings{
        const std::string get = "GET";
        const std::string post = "POST";
        const std::string put = "PUT";
        const std::string delete_ = "DELETE";
        const std::string head = "HEAD";
        const std::string options = "OPTIONS";
        const std::string connect = "CONNECT";
        const std::string patch = "PATCH";
        const std::string trace = "TRACE";
        const std::string unknown = "UNKNOWN";
    }

    const std::string& get_method(method http_method){
        switch(http_method){
            case method::GET:
                return method_strings::get;
            case method::POST:
                return method_strings::post;
            case method::PUT:
                return method_strings::put;
            case method::DELETE:
                return method_strings::delete_;
            case method::HEAD:
                return method_strings::head;
            case method::OPTIONS:
                return method_strings::options;
            case method::CONNECT:
                return method_strings::connect;
            case method::PATCH:
                return method_strings::patch;
            case method::TRACE:
                return method_strings::trace;
            default:
                return method_strings::unknown;
        }
    }

    method parse_method(std::string_view http_method){
        for(auto m : all_methods){
            if(get_method(m) == http_method) return m;
        }
        return method::UNKNOWN;
    }

}
