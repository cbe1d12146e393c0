#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace keypub {

// A published signing key. Created once, never updated.
struct KeyRecord {
    std::string id;          // canonical UUID-v4 (lowercase, hyphenated)
    std::string public_key;  // Base64 text exactly as submitted (trimmed)
    std::optional<std::string> note;
};

inline bool operator==(const KeyRecord& a, const KeyRecord& b) {
    return a.id == b.id && a.public_key == b.public_key && a.note == b.note;
}

// Raised by storage backends. what() carries internal detail for logs only.
class StoreError : public std::runtime_error {
public:
    enum class Kind {
        CONFLICT,     // id already present
        UNAVAILABLE   // I/O or connection failure
    };

    StoreError(Kind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};


// Abstract interface for persistent storage of published keys.
// The default implementation is a single SQLite table; a Redis backend is
// available for deployments that already run one.
class KeyStorage {
public:
    virtual ~KeyStorage() = default;

    /**
     * Inserts a new record atomically.
     * @throws StoreError CONFLICT if the id exists, UNAVAILABLE on I/O failure.
     */
    virtual void create(const KeyRecord& record) = 0;

    /**
     * Looks up a record by canonical id.
     * @return The record, or std::nullopt if no row matches.
     * @throws StoreError UNAVAILABLE on I/O failure.
     */
    virtual std::optional<KeyRecord> get(const std::string& id) = 0;

    // Short backend name reported by /health.
    virtual std::string backend_name() const = 0;
};

}
