#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

namespace keypub {


// Core server configuration. Defaults are overridden from the environment
// and the command line in main().
struct ServerConfig {
    // --- Network ---
    std::string address = "127.0.0.1";
    uint16_t port = 3003;
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Public site ---
    // Host name used to build the absolute shareable link (https://<host>/k/<id>).
    std::string site_host = "jiming.cleanyong.familybankbank.com";

    // --- Storage ---
    std::string storage_backend = "sqlite";  // "sqlite" or "redis"
    std::string db_path = "pubkeys.db";      // relative to the working directory
    std::string redis_url = "tcp://127.0.0.1:6379";

    // --- Request limits ---
    size_t max_body_size = 16 * 1024;
    int request_timeout_sec = 60;

    // --- Record constraints ---
    static constexpr size_t max_public_key_bytes = 1000;
    static constexpr size_t public_key_raw_bytes = 32;  // Ed25519
    static constexpr size_t max_note_bytes = 100;
};

// Parses a TCP port from the environment or the command line.
// Throws std::invalid_argument or std::out_of_range instead of wrapping.
inline uint16_t parse_port(const std::string& text) {
    size_t consumed = 0;
    int value = std::stoi(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("port is not a number: " + text);
    }
    if (value < 1 || value > 65535) {
        throw std::out_of_range("port out of range (1-65535): " + text);
    }
    return static_cast<uint16_t>(value);
}

}
