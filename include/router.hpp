#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include "server_config.hpp"
#include "key_storage.hpp"
#include "handlers/health_handler.hpp"
#include "handlers/key_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace keypub {

// Maps method + path to a handler. Transport-independent so it can be
// driven directly from tests.
class Router {
public:
    Router(const ServerConfig& config, KeyStorage& key_storage)
        : config_(config)
        , key_handler_(config, key_storage)
        , health_handler_(config, key_storage) {}

    /**
     * Produces the response for one request. Never throws: unexpected
     * exceptions become a generic 500.
     */
    http::response<http::string_body> route(const http::request<http::string_body>& req,
                                            const std::string& remote_addr);

    // Request target without its query string.
    static std::string path_of(const std::string& target);

private:
    const ServerConfig& config_;
    KeyHandler key_handler_;
    HealthHandler health_handler_;

    http::response<http::string_body> dispatch(const http::request<http::string_body>& req,
                                               const std::string& remote_addr);

    http::response<http::string_body> handle_not_found(const http::request<http::string_body>& req);
    http::response<http::string_body> handle_method_not_allowed(const http::request<http::string_body>& req,
                                                                const char* allow);
    http::response<http::string_body> handle_internal_error(const http::request<http::string_body>& req);
};

}
