#pragma once

#include <boost/beast/http.hpp>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;

namespace keypub {

// The pages carry their own inline <style>/<script>; nothing else is allowed.
inline constexpr const char* kContentSecurityPolicy =
    "default-src 'none'; style-src 'unsafe-inline'; script-src 'unsafe-inline'; "
    "form-action 'self'; base-uri 'none'; frame-ancestors 'none'";

template<class Body>
void add_security_headers(http::response<Body>& res, bool tls) {
    res.set(http::field::server, "keypub/1.0");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Referrer-Policy", "strict-origin-when-cross-origin");
    res.set("Content-Security-Policy", kContentSecurityPolicy);

    if (tls) {
        res.set("Strict-Transport-Security", "max-age=31536000; includeSubDomains");
    }
}

inline http::response<http::string_body> make_response(http::status status, unsigned version,
                                                       const std::string& content_type, std::string body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, content_type);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

inline http::response<http::string_body> text_response(http::status status, unsigned version, std::string body) {
    return make_response(status, version, "text/plain; charset=utf-8", std::move(body));
}

inline http::response<http::string_body> html_response(http::status status, unsigned version, std::string body) {
    return make_response(status, version, "text/html; charset=utf-8", std::move(body));
}

}
