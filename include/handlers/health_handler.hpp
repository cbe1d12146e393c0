#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "key_storage.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace keypub {

class HealthHandler {
public:
    HealthHandler(const ServerConfig& config, KeyStorage& key_storage)
        : config_(config), key_storage_(key_storage) {}

    http::response<http::string_body> handle_health(const http::request<http::string_body>& req);
    http::response<http::string_body> handle_metrics(const http::request<http::string_body>& req);

    // Metrics are only exposed to loopback peers.
    static bool is_local_peer(const std::string& remote_addr) {
        return remote_addr == "127.0.0.1" || remote_addr == "::1";
    }

private:
    const ServerConfig& config_;
    KeyStorage& key_storage_;
};

} // namespace keypub
