#include "agent/SessionStore.h"
#include "utils/Logger.h"
#include <random>
#include <sstream>
#include <vector>

void Session::append(const nlohmann::json& message) {
    if (!messages.is_array()) {
        messages = nlohmann::json::array();
    }
    messages.push_back(message);
}

void Session::pinAndTrim(const std::string& systemPrompt, size_t maxEntries) {
    nlohmann::json rest = nlohmann::json::array();
    if (messages.is_array()) {
        for (const auto& message : messages) {
            // any earlier system message is replaced by the pinned one
            if (message.is_object() && message.value("role", "") == "system") continue;
            rest.push_back(message);
        }
    }

    // the system message plus at least the latest entry
    size_t keep = maxEntries > 2 ? maxEntries - 1 : 1;
    size_t skip = rest.size() > keep ? rest.size() - keep : 0;

    nlohmann::json trimmed = nlohmann::json::array();
    trimmed.push_back({{"role", "system"}, {"content", systemPrompt}});
    for (size_t i = skip; i < rest.size(); ++i) {
        trimmed.push_back(rest[i]);
    }
    messages = std::move(trimmed);
}

InMemorySessionStore::InMemorySessionStore() : InMemorySessionStore(Options{}) {}

InMemorySessionStore::InMemorySessionStore(Options options, std::shared_ptr<SessionMap> backing)
    : options(options),
      sessions(backing ? std::move(backing) : std::make_shared<SessionMap>()),
      clock([] { return std::chrono::steady_clock::now(); }) {}

std::string InMemorySessionStore::generateId() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "sess-";
    for (int i = 0; i < 16; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

std::shared_ptr<Session> InMemorySessionStore::getOrCreate(const std::string& id, const std::string& systemPrompt) {
    std::vector<std::string> evicted;
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mtx);
        evictExpiredLocked(evicted);

        std::string sid = id.empty() ? generateId() : id;
        auto it = sessions->find(sid);
        if (it != sessions->end()) {
            session = it->second;
        } else {
            if (options.maxSessions > 0 && sessions->size() >= options.maxSessions) {
                evictOldestLocked(evicted);
            }
            session = std::make_shared<Session>();
            session->id = sid;
            session->messages.push_back({{"role", "system"}, {"content", systemPrompt}});
            (*sessions)[sid] = session;
            Logger::getInstance().debug("[Session] Created " + sid);
        }
        session->lastUsed = clock();
    }
    notifyEvicted(evicted);
    return session;
}

std::shared_ptr<Session> InMemorySessionStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions->find(id);
    return it == sessions->end() ? nullptr : it->second;
}

bool InMemorySessionStore::erase(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx);
    return sessions->erase(id) > 0;
}

size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return sessions->size();
}

size_t InMemorySessionStore::evictExpired() {
    std::vector<std::string> evicted;
    size_t count;
    {
        std::lock_guard<std::mutex> lock(mtx);
        count = evictExpiredLocked(evicted);
    }
    notifyEvicted(evicted);
    return count;
}

size_t InMemorySessionStore::evictExpiredLocked(std::vector<std::string>& evicted) {
    if (options.idleTtl.count() <= 0) return 0;

    auto now = clock();
    size_t count = 0;
    for (auto it = sessions->begin(); it != sessions->end();) {
        if (now - it->second->lastUsed > options.idleTtl) {
            evicted.push_back(it->first);
            it = sessions->erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    return count;
}

void InMemorySessionStore::evictOldestLocked(std::vector<std::string>& evicted) {
    auto oldest = sessions->end();
    for (auto it = sessions->begin(); it != sessions->end(); ++it) {
        if (oldest == sessions->end() || it->second->lastUsed < oldest->second->lastUsed) {
            oldest = it;
        }
    }
    if (oldest != sessions->end()) {
        evicted.push_back(oldest->first);
        sessions->erase(oldest);
    }
}

void InMemorySessionStore::notifyEvicted(const std::vector<std::string>& evicted) {
    for (const auto& id : evicted) {
        Logger::getInstance().debug("[Session] Evicted " + id);
        if (onEvict) onEvict(id);
    }
}
