#include "redis_key_storage.hpp"
#include <iostream>
#include <iterator>
#include <unordered_map>
#include <vector>

namespace keypub {

RedisKeyStorage::RedisKeyStorage(const std::string& redis_url) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(redis_url);
        redis_->ping();
        connected_ = true;
        std::cout << "[*] Redis key store connected: " << redis_url << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis connection failed: " << e.what() << "\n";
        connected_ = false;
    }
}

sw::redis::Redis& RedisKeyStorage::client() {
    if (!connected_ || !redis_) {
        throw StoreError(StoreError::Kind::UNAVAILABLE, "redis not connected");
    }
    return *redis_;
}

// Writes the hash only if the key does not exist yet, in one atomic script.
void RedisKeyStorage::create(const KeyRecord& record) {
    static const std::string script = R"(
        if redis.call('EXISTS', KEYS[1]) == 1 then
            return 0
        end
        redis.call('HSET', KEYS[1], 'public_key', ARGV[1])
        if ARGV[2] == '1' then
            redis.call('HSET', KEYS[1], 'note', ARGV[3])
        end
        return 1
    )";

    auto& redis = client();
    std::vector<std::string> keys = {key_for(record.id)};
    std::vector<std::string> args = {
        record.public_key,
        record.note ? "1" : "0",
        record.note.value_or("")
    };

    long long created = 0;
    try {
        created = redis.eval<long long>(script, keys.begin(), keys.end(), args.begin(), args.end());
    } catch (const sw::redis::Error& e) {
        throw StoreError(StoreError::Kind::UNAVAILABLE, std::string("redis insert failed: ") + e.what());
    }

    if (created != 1) {
        throw StoreError(StoreError::Kind::CONFLICT, "duplicate id " + record.id);
    }
}

std::optional<KeyRecord> RedisKeyStorage::get(const std::string& id) {
    auto& redis = client();
    std::unordered_map<std::string, std::string> fields;
    try {
        redis.hgetall(key_for(id), std::inserter(fields, fields.begin()));
    } catch (const sw::redis::Error& e) {
        throw StoreError(StoreError::Kind::UNAVAILABLE, std::string("redis lookup failed: ") + e.what());
    }

    auto key_it = fields.find("public_key");
    if (key_it == fields.end()) return std::nullopt;

    KeyRecord record;
    record.id = id;
    record.public_key = key_it->second;
    auto note_it = fields.find("note");
    if (note_it != fields.end()) record.note = note_it->second;
    return record;
}

}
