#include "router.hpp"
#include "handlers/response_util.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"

namespace keypub {

std::string Router::path_of(const std::string& target) {
    return target.substr(0, target.find('?'));
}

http::response<http::string_body> Router::route(const http::request<http::string_body>& req,
                                                const std::string& remote_addr) {
    MetricsRegistry::instance().increment_counter(metric::http_requests);
    try {
        return dispatch(req, remote_addr);
    } catch (const std::exception& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::INTERNAL_ERROR,
                         remote_addr, std::string("Unhandled request error: ") + e.what());
        return handle_internal_error(req);
    }
}

// --- Routing Table ---
http::response<http::string_body> Router::dispatch(const http::request<http::string_body>& req,
                                                   const std::string& remote_addr) {
    const std::string path = path_of(std::string(req.target()));
    const auto method = req.method();

    if (path == "/") {
        if (method != http::verb::get) return handle_method_not_allowed(req, "GET");
        return key_handler_.handle_form(req);
    }

    if (path == "/publish") {
        if (method != http::verb::post) return handle_method_not_allowed(req, "POST");
        return key_handler_.handle_publish(req, remote_addr);
    }

    // Single path segment after /k/
    if (path.rfind("/k/", 0) == 0 && path.size() > 3 && path.find('/', 3) == std::string::npos) {
        if (method != http::verb::get) return handle_method_not_allowed(req, "GET");
        return key_handler_.handle_show_record(req, path.substr(3), remote_addr);
    }

    if (path == "/health" && method == http::verb::get) {
        return health_handler_.handle_health(req);
    }

    if (path == "/metrics" && method == http::verb::get && HealthHandler::is_local_peer(remote_addr)) {
        return health_handler_.handle_metrics(req);
    }

    return handle_not_found(req);
}

http::response<http::string_body> Router::handle_not_found(const http::request<http::string_body>& req) {
    auto res = text_response(http::status::not_found, req.version(), "Not Found");
    res.keep_alive(req.keep_alive());
    add_security_headers(res, config_.enable_tls);
    return res;
}

http::response<http::string_body> Router::handle_method_not_allowed(const http::request<http::string_body>& req,
                                                                    const char* allow) {
    auto res = text_response(http::status::method_not_allowed, req.version(), "Method Not Allowed");
    res.set(http::field::allow, allow);
    res.keep_alive(req.keep_alive());
    add_security_headers(res, config_.enable_tls);
    return res;
}

http::response<http::string_body> Router::handle_internal_error(const http::request<http::string_body>& req) {
    auto res = text_response(http::status::internal_server_error, req.version(), "internal error");
    res.keep_alive(false);
    add_security_headers(res, config_.enable_tls);
    return res;
}

}
