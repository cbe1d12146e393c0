#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <sw/redis++/redis++.h>
#include "key_storage.hpp"

namespace keypub {

// Redis-backed key store. Each record lives in a hash "pubkey:<id>".
// Redis executes commands one at a time, so inserts are serialized server-side.
class RedisKeyStorage : public KeyStorage {
public:
    explicit RedisKeyStorage(const std::string& redis_url);
    ~RedisKeyStorage() override = default;

    void create(const KeyRecord& record) override;
    std::optional<KeyRecord> get(const std::string& id) override;
    std::string backend_name() const override { return "redis"; }

    bool is_connected() const { return connected_; }

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};

    static std::string key_for(const std::string& id) { return "pubkey:" + id; }
    sw::redis::Redis& client();
};

}
