#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief 会话: id + 有序消息列表
 *
 * messages[0] 始终是 system 消息。turnMutex 串行化同一会话上的 turn,
 * 不同会话之间互不阻塞。
 */
struct Session {
    std::string id;
    nlohmann::json messages = nlohmann::json::array();
    std::chrono::steady_clock::time_point lastUsed;
    std::mutex turnMutex;

    void append(const nlohmann::json& message);

    // Re-pins systemPrompt at index 0, then keeps at most maxEntries messages
    // (the system message included), dropping the oldest.
    void pinAndTrim(const std::string& systemPrompt, size_t maxEntries);
};

class SessionStore {
public:
    virtual ~SessionStore() = default;

    // Empty id -> a freshly generated one.
    virtual std::shared_ptr<Session> getOrCreate(const std::string& id, const std::string& systemPrompt) = 0;
    virtual std::shared_ptr<Session> find(const std::string& id) const = 0;
    virtual bool erase(const std::string& id) = 0;
    virtual size_t size() const = 0;
};

/**
 * In-process store. Optional idle TTL and capacity bound; evicted ids are
 * reported through the eviction listener.
 */
class InMemorySessionStore : public SessionStore {
public:
    using SessionMap = std::unordered_map<std::string, std::shared_ptr<Session>>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using EvictionListener = std::function<void(const std::string& id)>;

    struct Options {
        std::chrono::seconds idleTtl{0};   // 0: never expire
        size_t maxSessions = 0;            // 0: unbounded
    };

    InMemorySessionStore();
    explicit InMemorySessionStore(Options options, std::shared_ptr<SessionMap> backing = nullptr);

    std::shared_ptr<Session> getOrCreate(const std::string& id, const std::string& systemPrompt) override;
    std::shared_ptr<Session> find(const std::string& id) const override;
    bool erase(const std::string& id) override;
    size_t size() const override;

    // Drops sessions idle longer than the TTL; returns how many went.
    size_t evictExpired();

    void setClock(Clock clock) { this->clock = std::move(clock); }
    void setEvictionListener(EvictionListener listener) { onEvict = std::move(listener); }

    static std::string generateId();

private:
    Options options;
    std::shared_ptr<SessionMap> sessions;
    mutable std::mutex mtx;
    Clock clock;
    EvictionListener onEvict;

    size_t evictExpiredLocked(std::vector<std::string>& evicted);
    void evictOldestLocked(std::vector<std::string>& evicted);
    void notifyEvicted(const std::vector<std::string>& evicted);
};
