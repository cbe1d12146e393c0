#include <gtest/gtest.h>
#include "router.hpp"
#include "sqlite_key_storage.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <set>
#include <mutex>
#include <thread>
#include <vector>

using namespace keypub;
using namespace keypub::testing;

TEST(StressTest, ConcurrentPublishAndLookup) {
    TempDb db;
    ServerConfig config;
    SqliteKeyStorage storage(db.path());
    Router router(config, storage);

    const int num_threads = 8;
    const int publishes_per_thread = 100;
    std::atomic<int> success_count{0};
    std::mutex ids_mutex;
    std::set<std::string> locations;

    auto worker = [&](int thread_id) {
        for (int i = 0; i < publishes_per_thread; ++i) {
            std::string key = make_key(32, static_cast<unsigned char>(thread_id * 16 + i));
            auto res = router.route(make_publish("public_key=" + form_encode(key) +
                                                 "&note=worker+" + std::to_string(thread_id)),
                                    "192.0.2." + std::to_string(thread_id));
            if (res.result() != http::status::see_other) continue;

            std::string location(res[http::field::location]);
            auto page = router.route(make_get(location), "192.0.2.200");
            if (page.result() == http::status::ok && page.body().find(key) != std::string::npos) {
                success_count++;
                std::lock_guard<std::mutex> lock(ids_mutex);
                locations.insert(location);
            }
        }
    };

    std::vector<std::thread> threads;
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker, i);
    }
    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double> diff = end - start;
    std::cout << "[*] Published and served " << success_count << " keys in " << diff.count() << "s" << std::endl;

    EXPECT_EQ(success_count, num_threads * publishes_per_thread);
    EXPECT_EQ(locations.size(), static_cast<size_t>(num_threads * publishes_per_thread));
    EXPECT_EQ(count_rows(db.path()), num_threads * publishes_per_thread);
}
