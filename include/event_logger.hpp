#pragma once

#include <string>
#include <iostream>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace keypub {

// Structured request/event log. Client addresses are never written in the
// clear: they are replaced by a salted hash whose salt rotates every 6 hours.
class EventLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        KEY_PUBLISHED,
        KEY_SERVED,
        INVALID_INPUT,
        NOT_FOUND,
        STORE_FAILURE,
        INTERNAL_ERROR,
        LIFECYCLE
    };

    /**
     * Records one event.
     * @param level Severity; ERROR and CRITICAL go to stderr.
     * @param event Event category.
     * @param remote_addr Source IP (blinded before logging), or "internal"/"unknown".
     * @param message Optional descriptive message (sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                    const std::string& message = "") {
        std::string line = format(level, event, blind_address(remote_addr), message);
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
    }

    static std::string format(Level level, EventType event, const std::string& ip,
                              const std::string& message) {
        std::stringstream ss;
        ss << "[" << timestamp() << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "ip=" << ip;
        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        return ss.str();
    }

    // Strips quotes, backslashes, line breaks and non-printable bytes.
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

    static std::string blind_address(const std::string& remote_addr) {
        if (remote_addr.empty() || remote_addr == "unknown" || remote_addr == "internal") {
            return remote_addr.empty() ? "unknown" : remote_addr;
        }

        std::string salt = current_salt();
        std::string data = remote_addr + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

private:
    static std::string timestamp() {
        auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        struct tm gmt;
        gmtime_r(&time_t, &gmt);
        std::stringstream ss;
        ss << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    static std::string current_salt() {
        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::lock_guard<std::mutex> lock(salt_mutex);
        auto now = std::chrono::steady_clock::now();
        if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now - last_rotation).count() >= 6) {
            unsigned char b[32];
            if (RAND_bytes(b, 32) != 1) {
                std::cerr << "[CRITICAL] CSPRNG failure in EventLogger. Terminating instance for safety.\n";
                std::terminate();
            }
            std::stringstream salt_ss;
            for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
            log_salt = salt_ss.str();
            last_rotation = now;
        }
        return log_salt;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::KEY_PUBLISHED: return "KEY_PUBLISHED";
            case EventType::KEY_SERVED: return "KEY_SERVED";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::NOT_FOUND: return "NOT_FOUND";
            case EventType::STORE_FAILURE: return "STORE_FAILURE";
            case EventType::INTERNAL_ERROR: return "INTERNAL_ERROR";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
