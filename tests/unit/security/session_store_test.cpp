/// @file session_store_test.cpp
/// @brief Tests for the in-memory session store

#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "security/session_store.h"

namespace promptguard::security {
namespace {

TEST(InMemorySessionStoreTest, CreateAndGet) {
    InMemorySessionStore store;
    store.CreateSession("s1", {{"user", "alice"}});

    auto record = store.GetSession("s1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->session_id, "s1");
    EXPECT_EQ(record->attributes.at("user"), "alice");
    EXPECT_EQ(store.Count(), 1u);
}

TEST(InMemorySessionStoreTest, MissingSessionIsNullopt) {
    InMemorySessionStore store;
    EXPECT_FALSE(store.GetSession("nope").has_value());
}

TEST(InMemorySessionStoreTest, RemoveIsIdempotent) {
    InMemorySessionStore store;
    store.CreateSession("s1");

    EXPECT_TRUE(store.RemoveSession("s1"));
    EXPECT_FALSE(store.RemoveSession("s1"));
    EXPECT_FALSE(store.GetSession("s1").has_value());
    EXPECT_EQ(store.Count(), 0u);
}

TEST(InMemorySessionStoreTest, CreateReplacesExisting) {
    InMemorySessionStore store;
    store.CreateSession("s1", {{"k", "old"}});
    store.CreateSession("s1", {{"k", "new"}});
    EXPECT_EQ(store.Count(), 1u);
    EXPECT_EQ(store.GetSession("s1")->attributes.at("k"), "new");
}

TEST(InMemorySessionStoreTest, ConcurrentAccess) {
    InMemorySessionStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < 100; ++i) {
                const std::string id = "s" + std::to_string(t) + "-" + std::to_string(i);
                store.CreateSession(id);
                store.GetSession(id);
                if (i % 2 == 0) {
                    store.RemoveSession(id);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(store.Count(), 200u);
}

}  // namespace
}  // namespace promptguard::security
