#include "headers.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "../../util/logger.hpp"

namespace routekit::http{

    void headers::add_header(std::string key, std::string value){
        if(key.empty()) return;
        headers_.emplace_back(std::move(key), std::move(value));
    }

    void headers::set_header(std::string key, std::string value){
        for(auto& header : headers_)
        {
            if(is_header(header.first, key)){
                header.second = std::move(value);
                return;
            }
        }
        add_header(std::move(key), std::move(value));
    }

    bool headers::remove_header(std::string_view key)
    {
        auto removed = std::erase_if(headers_, [&](const http_header& header){
            return is_header(header.first, key);
        });
        return removed > 0;
    }

    bool headers::has_header(std::string_view key) const{
        for(const auto& header : headers_)
        {
            if(is_header(header.first, key)){
                return true;
            }
        }
        return false;
    }

    const std::string& headers::get_header(std::string_view key) const
    {
        for(const auto& header : headers_)
        {
            if(is_header(header.first, key)){
                return header.second;
            }
        }
        static const std::string empty;
        return empty;
    }

    std::vector<std::string> headers::get_headers_with_key(std::string_view key) const{
        std::vector<std::string> values;
        for(const auto& header : headers_)
        {
            if(is_header(header.first, key)){
                values.push_back(header.second);
            }
        }
        return values;
    }

    const std::vector<headers::http_header>& headers::get_headers() const{
        return headers_;
    }

    std::vector<headers::http_header>& headers::get_headers(){
        return headers_;
    }

    bool headers::empty_headers() const{
        return headers_.empty();
    }

    const std::string& headers::get_authorization() const
    {
        return get_header(header::authorization);
    }

    const std::string& headers::get_user_agent() const{
        return get_header(header::user_agent);
    }

    const std::string& headers::get_content_type() const
    {
        return get_header(header::content_type);
    }

    bool headers::is_content_type(std::string_view value) const
    {
        return boost::istarts_with(get_header(header::content_type), value);
    }

    std::optional<size_t> headers::get_content_length() const{
        if(!has_header(header::content_length)) return std::nullopt;
        auto value = boost::algorithm::trim_copy(get_header(header::content_length));
        // lexical_cast wraps negative values around for unsigned targets
        if(value.empty() || value.front() == '-') return std::nullopt;
        try{
            return boost::lexical_cast<size_t>(value);
        }catch(const boost::bad_lexical_cast&){
            return std::nullopt;
        }
    }

    void headers::log(const char* scope) const{
        LOG_DEBUG("[{}] Headers:", scope);
        for(const auto& t: headers_){
            LOG_DEBUG("  {}: {}", t.first, t.second);
        }
    }

    bool headers::is_header(std::string_view key, std::string_view header){
        return boost::iequals(key, header);
    }

}
