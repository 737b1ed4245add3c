#include <gtest/gtest.h>
#include "../src/agent/SessionStore.h"
#include <atomic>
#include <thread>
#include <vector>

TEST(SessionTest, PinAndTrimKeepsSystemFirstAndBoundsSize) {
    Session session;
    session.append({{"role", "system"}, {"content", "old prompt"}});
    for (int i = 0; i < 20; ++i) {
        session.append({{"role", i % 2 ? "assistant" : "user"}, {"content", "m" + std::to_string(i)}});
    }

    session.pinAndTrim("new prompt", 12);

    ASSERT_EQ(session.messages.size(), 12u);
    EXPECT_EQ(session.messages[0]["role"], "system");
    EXPECT_EQ(session.messages[0]["content"], "new prompt");
    EXPECT_EQ(session.messages[1]["content"], "m9");
    EXPECT_EQ(session.messages.back()["content"], "m19");
}

TEST(SessionTest, PinAndTrimOnShortHistory) {
    Session session;
    session.append({{"role", "user"}, {"content", "hello"}});
    session.pinAndTrim("sys", 12);

    ASSERT_EQ(session.messages.size(), 2u);
    EXPECT_EQ(session.messages[0]["content"], "sys");
    EXPECT_EQ(session.messages[1]["content"], "hello");
}

TEST(SessionTest, TinyWindowStillKeepsLatestMessage) {
    for (size_t window : {0u, 1u, 2u}) {
        Session session;
        session.append({{"role", "user"}, {"content", "first"}});
        session.append({{"role", "user"}, {"content", "latest"}});
        session.pinAndTrim("sys", window);

        ASSERT_EQ(session.messages.size(), 2u) << "window " << window;
        EXPECT_EQ(session.messages[0]["role"], "system");
        EXPECT_EQ(session.messages[1]["content"], "latest");
    }
}

TEST(InMemorySessionStoreTest, GetOrCreateReusesById) {
    InMemorySessionStore store;
    auto a = store.getOrCreate("s1", "sys");
    auto b = store.getOrCreate("s1", "sys");
    EXPECT_EQ(a, b);
    EXPECT_EQ(store.size(), 1u);
    ASSERT_EQ(a->messages.size(), 1u);
    EXPECT_EQ(a->messages[0]["role"], "system");
}

TEST(InMemorySessionStoreTest, EmptyIdGeneratesFreshSession) {
    InMemorySessionStore store;
    auto a = store.getOrCreate("", "sys");
    auto b = store.getOrCreate("", "sys");
    EXPECT_NE(a->id, b->id);
    EXPECT_EQ(a->id.rfind("sess-", 0), 0u);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.find(a->id), a);
}

TEST(InMemorySessionStoreTest, EraseAndFind) {
    InMemorySessionStore store;
    store.getOrCreate("gone", "sys");
    EXPECT_TRUE(store.erase("gone"));
    EXPECT_FALSE(store.erase("gone"));
    EXPECT_EQ(store.find("gone"), nullptr);
}

TEST(InMemorySessionStoreTest, InjectedBackingMapIsShared) {
    auto backing = std::make_shared<InMemorySessionStore::SessionMap>();
    InMemorySessionStore first(InMemorySessionStore::Options{}, backing);
    InMemorySessionStore second(InMemorySessionStore::Options{}, backing);

    auto created = first.getOrCreate("shared", "sys");
    EXPECT_EQ(second.find("shared"), created);
    EXPECT_EQ(backing->size(), 1u);
}

TEST(InMemorySessionStoreTest, IdleSessionsExpire) {
    InMemorySessionStore::Options options;
    options.idleTtl = std::chrono::seconds(60);
    InMemorySessionStore store(options);

    auto now = std::chrono::steady_clock::now();
    store.setClock([&now] { return now; });
    std::vector<std::string> evicted;
    store.setEvictionListener([&](const std::string& id) { evicted.push_back(id); });

    store.getOrCreate("old", "sys");
    now += std::chrono::seconds(30);
    store.getOrCreate("fresh", "sys");
    now += std::chrono::seconds(45);

    EXPECT_EQ(store.evictExpired(), 1u);
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], "old");
    EXPECT_NE(store.find("fresh"), nullptr);
}

TEST(InMemorySessionStoreTest, CapacityEvictsLeastRecentlyUsed) {
    InMemorySessionStore::Options options;
    options.maxSessions = 2;
    InMemorySessionStore store(options);

    auto now = std::chrono::steady_clock::now();
    store.setClock([&now] { return now; });
    std::vector<std::string> evicted;
    store.setEvictionListener([&](const std::string& id) { evicted.push_back(id); });

    store.getOrCreate("a", "sys");
    now += std::chrono::seconds(1);
    store.getOrCreate("b", "sys");
    now += std::chrono::seconds(1);
    store.getOrCreate("a", "sys");  // touch
    now += std::chrono::seconds(1);
    store.getOrCreate("c", "sys");

    EXPECT_EQ(store.size(), 2u);
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], "b");
}

TEST(InMemorySessionStoreTest, ConcurrentGetOrCreateYieldsOneSession) {
    InMemorySessionStore store;
    std::vector<std::shared_ptr<Session>> seen(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i] { seen[i] = store.getOrCreate("same", "sys"); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(store.size(), 1u);
    for (const auto& session : seen) {
        EXPECT_EQ(session, seen[0]);
    }
}
