#include "http_session.hpp"
#include "metrics.hpp"
#include <iostream>

namespace keypub {

// HTTPS Session state (TLS transport)
HttpSession::HttpSession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    const ServerConfig& config,
    KeyStorage& key_storage
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , router_(config, key_storage)
{
    try {
        auto& s = std::get<beast::ssl_stream<beast::tcp_stream>>(stream_);
        auto ep = beast::get_lowest_layer(s).socket().remote_endpoint();
        remote_addr_ = ep.address().to_string();
    } catch (const std::exception&) {
        remote_addr_ = "unknown";
    }
    MetricsRegistry::instance().increment_gauge(metric::active_sessions);
}

// Plaintext HTTP Session state (usually behind a local reverse proxy)
HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    KeyStorage& key_storage
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , router_(config, key_storage)
{
    try {
        auto& s = std::get<beast::tcp_stream>(stream_);
        auto ep = beast::get_lowest_layer(s).socket().remote_endpoint();
        remote_addr_ = ep.address().to_string();
    } catch (const std::exception&) {
        remote_addr_ = "unknown";
    }
    MetricsRegistry::instance().increment_gauge(metric::active_sessions);
}

HttpSession::~HttpSession() {
    MetricsRegistry::instance().decrement_gauge(metric::active_sessions);
}

void HttpSession::run() {
    if (is_tls_) {
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Silent closure on handshake failure
        return;
    }
    do_read();
}

void HttpSession::do_read() {
    req_ = {};

    // Idle connections are dropped after the request timeout
    if (is_tls_) {
        beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).expires_after(
            std::chrono::seconds(config_.request_timeout_sec));
    } else {
        beast::get_lowest_layer(std::get<beast::tcp_stream>(stream_)).expires_after(
            std::chrono::seconds(config_.request_timeout_sec));
    }

    auto self = shared_from_this();
    parser_.emplace();
    parser_->body_limit(config_.max_body_size);

    if (is_tls_) {
        http::async_read(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        http::async_read(
            std::get<beast::tcp_stream>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec) {
        if (ec != beast::error::timeout) {
            std::cerr << "[!] HTTP read error: " << ec.message() << "\n";
        }
        return;
    }

    req_ = parser_->release();
    handle_request();
}

void HttpSession::handle_request() {
    send_response(router_.route(req_, remote_addr_));
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    auto self = shared_from_this();

    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        std::cerr << "[!] HTTP write error: " << ec.message() << "\n";
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    if (is_tls_) {
        beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).socket().shutdown(
            tcp::socket::shutdown_send, ec);
    } else {
        beast::get_lowest_layer(std::get<beast::tcp_stream>(stream_)).socket().shutdown(
            tcp::socket::shutdown_send, ec);
    }
}

}
