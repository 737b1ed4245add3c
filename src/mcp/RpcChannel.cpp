#include "mcp/RpcChannel.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <climits>
#include <cstdint>
#include <vector>

namespace {
std::string clip(const std::string& text, size_t limit = 200) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + "...";
}

long long elapsedMs(EventLoop::Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(EventLoop::Clock::now() - since).count();
}
} // namespace

RpcChannel::RpcChannel(EventLoop& loop, std::unique_ptr<FrameCodec> codec)
    : loop(loop), codec(codec ? std::move(codec) : std::make_unique<LineFrameCodec>()) {}

RpcChannel::~RpcChannel() {
    for (auto& [id, entry] : pending) {
        loop.cancelTimer(entry.timer);
    }
}

int RpcChannel::request(const std::string& method, const nlohmann::json& params,
                        ResultHandler onResult, ErrorHandler onError,
                        std::chrono::milliseconds timeout) {
    if (!writer) {
        throw ProcessTerminated("No peer attached for request: " + method);
    }

    int id = ++nextId;
    nlohmann::json message = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params}
    };

    // Write before registering so a failed write leaves nothing behind.
    writer(codec->encode(message));

    PendingRequest entry;
    entry.id = id;
    entry.method = method;
    entry.onResult = std::move(onResult);
    entry.onError = std::move(onError);
    entry.startedAt = EventLoop::Clock::now();
    entry.timer = loop.runAfter(timeout, [this, id] { onTimeout(id); });
    pending.emplace(id, std::move(entry));

    Logger::getInstance().debug("[Bridge] -> #" + std::to_string(id) + " " + method);
    return id;
}

void RpcChannel::notify(const std::string& method, const nlohmann::json& params) {
    if (!writer) return;
    nlohmann::json message = {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params}
    };
    writer(codec->encode(message));
}

void RpcChannel::feed(const char* data, size_t size) {
    codec->feed(data, size, [this](const std::string& frame) { handleFrame(frame); });
}

void RpcChannel::handleFrame(const std::string& frame) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(frame);
    } catch (const nlohmann::json::parse_error&) {
        Logger::getInstance().error("[Bridge] Failed to parse JSON-RPC message: " + clip(frame));
        return;
    }

    if (!message.is_object()) {
        Logger::getInstance().warn("[Bridge] Ignoring non-object message: " + clip(frame));
        return;
    }
    dispatch(message);
}

void RpcChannel::dispatch(const nlohmann::json& message) {
    auto idIt = message.find("id");
    if (idIt == message.end() || idIt->is_null()) {
        if (message.contains("method")) {
            Logger::getInstance().debug("[Bridge] Notification from server: " +
                                        message["method"].dump());
        } else {
            Logger::getInstance().warn("[Bridge] Message without id ignored");
        }
        return;
    }

    if (!idIt->is_number_integer()) {
        Logger::getInstance().warn("[Bridge] Received response for unknown request ID: " + idIt->dump());
        return;
    }

    // ids are allocated from 1 upward as int; anything wider cannot be ours
    std::int64_t rawId = idIt->get<std::int64_t>();
    auto it = rawId >= 1 && rawId <= INT_MAX ? pending.find(static_cast<int>(rawId)) : pending.end();
    if (it == pending.end()) {
        Logger::getInstance().warn("[Bridge] Received response for unknown request ID: " + idIt->dump());
        return;
    }
    int id = it->first;

    PendingRequest entry = std::move(it->second);
    pending.erase(it);
    loop.cancelTimer(entry.timer);

    auto errorIt = message.find("error");
    if (errorIt != message.end() && !errorIt->is_null()) {
        int code = errorIt->is_object() ? errorIt->value("code", -32603) : -32603;
        std::string text = errorIt->is_object()
            ? errorIt->value("message", std::string("Unknown JSON-RPC error"))
            : errorIt->dump();
        nlohmann::json data = errorIt->is_object() && errorIt->contains("data")
            ? (*errorIt)["data"] : nlohmann::json();
        Logger::getInstance().warn("[Bridge] <- #" + std::to_string(id) + " " + entry.method +
                                   " failed after " + std::to_string(elapsedMs(entry.startedAt)) +
                                   "ms: " + text);
        entry.onError(std::make_exception_ptr(RpcError(code, text, data)));
        return;
    }

    Logger::getInstance().debug("[Bridge] <- #" + std::to_string(id) + " " + entry.method +
                                " completed in " + std::to_string(elapsedMs(entry.startedAt)) + "ms");
    entry.onResult(message.contains("result") ? message["result"] : nlohmann::json());
}

void RpcChannel::onTimeout(int id) {
    auto it = pending.find(id);
    if (it == pending.end()) return;

    PendingRequest entry = std::move(it->second);
    pending.erase(it);

    long long elapsed = elapsedMs(entry.startedAt);
    Logger::getInstance().warn("[Bridge] Request timeout after " + std::to_string(elapsed) +
                               "ms: " + entry.method);
    entry.onError(std::make_exception_ptr(ProtocolTimeout(entry.method, elapsed)));
}

void RpcChannel::failAll(const std::string& reason) {
    if (pending.empty()) return;

    // Detach the table first: handlers may issue new requests.
    std::vector<PendingRequest> failed;
    failed.reserve(pending.size());
    for (auto& [id, entry] : pending) {
        loop.cancelTimer(entry.timer);
        failed.push_back(std::move(entry));
    }
    pending.clear();

    for (auto& entry : failed) {
        entry.onError(std::make_exception_ptr(ProcessTerminated(reason)));
    }
}

void RpcChannel::reset(const std::string& reason) {
    codec->reset();
    failAll(reason);
}
