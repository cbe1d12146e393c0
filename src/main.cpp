#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <filesystem>
#include <cstdlib>

#include "server_config.hpp"
#include "key_storage.hpp"
#include "sqlite_key_storage.hpp"
#include "redis_key_storage.hpp"
#include "http_session.hpp"
#include "event_logger.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace keypub {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        KeyStorage& key_storage
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , key_storage_(key_storage)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

    tcp::endpoint local_endpoint() const {
        return acceptor_.local_endpoint();
    }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    KeyStorage& key_storage_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;  // acceptor closed during shutdown
        }

        if (ec) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::LIFECYCLE,
                             "internal", "Accept error: " + ec.message());
        } else if (config_.enable_tls) {
            std::make_shared<HttpSession>(
                beast::ssl_stream<beast::tcp_stream>(beast::tcp_stream(std::move(socket)), ssl_ctx_),
                config_,
                key_storage_
            )->run();
        } else {
            std::make_shared<HttpSession>(
                beast::tcp_stream(std::move(socket)),
                config_,
                key_storage_
            )->run();
        }

        do_accept();
    }
};

// Picks the storage backend named in the configuration.
std::unique_ptr<KeyStorage> make_key_storage(const ServerConfig& config) {
    if (config.storage_backend == "sqlite") {
        return std::make_unique<SqliteKeyStorage>(config.db_path);
    }
    if (config.storage_backend == "redis") {
        auto redis = std::make_unique<RedisKeyStorage>(config.redis_url);
        if (!redis->is_connected()) {
            throw std::runtime_error("Redis key store unreachable at " + config.redis_url);
        }
        return redis;
    }
    throw std::runtime_error("Unknown storage backend: " + config.storage_backend);
}

}

// Configures the SSL context (TLS 1.2+).
void load_server_certificate(ssl::context& ctx, const std::string& cert_path, const std::string& key_path) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    ctx.use_certificate_chain_file(cert_path);
    ctx.use_private_key_file(key_path, ssl::context::pem);
}

int main(int argc, char* argv[]) {
    using keypub::EventLogger;
    try {
        keypub::ServerConfig config;

        // --- Environment Variable Overrides ---
        if (const char* env_site = std::getenv("WEBSITE_NAME")) {
            config.site_host = env_site;
        }
        if (const char* env_port = std::getenv("KEYPUB_PORT")) {
            config.port = keypub::parse_port(env_port);
        }
        if (const char* env_addr = std::getenv("KEYPUB_ADDR")) {
            config.address = env_addr;
        }
        if (const char* env_db = std::getenv("KEYPUB_DB_PATH")) {
            config.db_path = env_db;
        }
        if (const char* env_storage = std::getenv("KEYPUB_STORAGE")) {
            config.storage_backend = env_storage;
        }
        if (const char* env_redis = std::getenv("KEYPUB_REDIS_URL")) {
            config.redis_url = env_redis;
        }
        if (const char* env_threads = std::getenv("KEYPUB_THREADS")) {
            config.thread_count = std::stoi(env_threads);
        }
        if (const char* env_tls = std::getenv("KEYPUB_TLS")) {
            config.enable_tls = std::string(env_tls) == "1";
        }
        if (const char* e = std::getenv("KEYPUB_CERT")) config.cert_path = e;
        if (const char* e = std::getenv("KEYPUB_KEY")) config.key_path = e;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--tls" || arg == "-t") {
                config.enable_tls = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port] [options]\n"
                          << "Options:\n"
                          << "  --tls, -t      Serve HTTPS using KEYPUB_CERT / KEYPUB_KEY\n"
                          << "  --help, -h     Show this help\n";
                return 0;
            } else {
                config.port = keypub::parse_port(arg);
            }
        }

        if (config.thread_count <= 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        if (config.enable_tls &&
            (!std::filesystem::exists(config.cert_path) || !std::filesystem::exists(config.key_path))) {
            std::cerr << "[!] TLS certificates not found at:\n"
                      << "    " << config.cert_path << "\n"
                      << "    " << config.key_path << "\n";
            return 1;
        }

        net::io_context ioc{config.thread_count};

        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        // Created once, shared by every session, destroyed after the io threads stop.
        std::unique_ptr<keypub::KeyStorage> key_storage = keypub::make_key_storage(config);

        auto listener = std::make_shared<keypub::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            *key_storage
        );
        listener->run();

        std::cout << "Key publish site running at " << (config.enable_tls ? "https" : "http")
                  << "://" << listener->local_endpoint() << "/\n";
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE, "internal",
                         "Serving site " + config.site_host + " from " + key_storage->backend_name() + " storage");

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener](beast::error_code const&, int) {
                EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE, "internal",
                                 "Initiating graceful shutdown");
                listener->stop();
                ioc.stop();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
