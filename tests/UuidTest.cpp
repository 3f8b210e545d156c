#include <catch2/catch.hpp>
#include "util/Uuid.hpp"
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using issues::util::generateUuid;

TEST_CASE("generateUuid produces version 4 UUIDs", "[Uuid]") {
    std::string id = generateUuid();

    REQUIRE(id.size() == 36);
    REQUIRE(id[8] == '-');
    REQUIRE(id[13] == '-');
    REQUIRE(id[18] == '-');
    REQUIRE(id[23] == '-');
    REQUIRE(id[14] == '4');
    REQUIRE(std::string("89ab").find(id[19]) != std::string::npos);
}

TEST_CASE("generateUuid does not repeat across threads", "[Uuid]") {
    std::set<std::string> seen;
    std::mutex mutex;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            std::vector<std::string> local;
            for (int i = 0; i < 500; ++i) {
                local.push_back(generateUuid());
            }
            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(local.begin(), local.end());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(seen.size() == 8 * 500);
}
