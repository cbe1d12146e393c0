#include "handlers/health_handler.hpp"
#include "handlers/response_util.hpp"

namespace keypub {

http::response<http::string_body> HealthHandler::handle_health(const http::request<http::string_body>& req) {
    json::object response;
    response["status"] = "healthy";
    response["storage"] = key_storage_.backend_name();
    response["tls"] = config_.enable_tls;

    auto res = make_response(http::status::ok, req.version(), "application/json", json::serialize(response));
    res.keep_alive(req.keep_alive());
    add_security_headers(res, config_.enable_tls);
    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(const http::request<http::string_body>& req) {
    auto res = make_response(http::status::ok, req.version(), "text/plain; version=0.0.4",
                             MetricsRegistry::instance().collect_prometheus());
    res.keep_alive(req.keep_alive());
    add_security_headers(res, config_.enable_tls);
    return res;
}

} // namespace keypub
