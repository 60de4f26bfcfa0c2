#include <gtest/gtest.h>
#include <hwident/cache.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace hwident {
namespace {

IdentifierResult sample_result(const std::string& uuid) {
    IdentifierResult result;
    result.identifiers[keys::SYSTEM_UUID] = uuid;
    return result;
}

ResolverConfig config_with(bool include_fallback) {
    ResolverConfig config;
    config.include_fallback = include_fallback;
    return config;
}

// ==================== ResolutionCache Tests ====================

TEST(ResolutionCacheTest, ComputesOnceAndReturnsStoredValue) {
    ResolutionCache cache;
    int calls = 0;
    auto compute = [&]() {
        ++calls;
        return Result<IdentifierResult>::ok(sample_result("uuid-" + std::to_string(calls)));
    };

    auto first = cache.get_or_compute(config_with(true), compute);
    auto second = cache.get_or_compute(config_with(true), compute);

    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(second.value().identifiers.at(keys::SYSTEM_UUID), "uuid-1");
}

TEST(ResolutionCacheTest, ConfigsHaveSeparateEntries) {
    ResolutionCache cache;
    int calls = 0;
    auto compute = [&]() {
        ++calls;
        return Result<IdentifierResult>::ok(sample_result("uuid-" + std::to_string(calls)));
    };

    auto with_fallback = cache.get_or_compute(config_with(true), compute);
    auto without_fallback = cache.get_or_compute(config_with(false), compute);

    EXPECT_EQ(calls, 2);
    EXPECT_NE(with_fallback.value(), without_fallback.value());
}

TEST(ResolutionCacheTest, FailuresAreNotStored) {
    ResolutionCache cache;
    int calls = 0;
    auto failing = [&]() {
        ++calls;
        return Result<IdentifierResult>::error(ErrorCode::Unknown, "transient");
    };

    EXPECT_TRUE(cache.get_or_compute(config_with(false), failing).is_error());
    EXPECT_FALSE(cache.peek(config_with(false)).has_value());

    auto ok = cache.get_or_compute(config_with(false), [&]() {
        ++calls;
        return Result<IdentifierResult>::ok(sample_result("late"));
    });

    EXPECT_EQ(calls, 2);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_TRUE(cache.peek(config_with(false)).has_value());
}

TEST(ResolutionCacheTest, PeekDoesNotCompute) {
    ResolutionCache cache;

    EXPECT_FALSE(cache.peek(config_with(true)).has_value());

    (void)cache.get_or_compute(config_with(true),
                               []() { return Result<IdentifierResult>::ok(sample_result("u")); });

    auto cached = cache.peek(config_with(true));
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->identifiers.at(keys::SYSTEM_UUID), "u");
    EXPECT_FALSE(cache.peek(config_with(false)).has_value());
}

TEST(ResolutionCacheTest, ConcurrentMissComputesOnce) {
    ResolutionCache cache;
    std::atomic<int> calls{0};
    auto compute = [&]() {
        calls.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return Result<IdentifierResult>::ok(sample_result("shared"));
    };

    std::vector<std::thread> threads;
    std::atomic<int> ok_count{0};
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            auto result = cache.get_or_compute(config_with(true), compute);
            if (result.is_ok() &&
                result.value().identifiers.at(keys::SYSTEM_UUID) == "shared") {
                ok_count.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(ok_count.load(), 16);
}

}  // namespace
}  // namespace hwident
