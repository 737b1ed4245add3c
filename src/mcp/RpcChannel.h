#pragma once
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/EventLoop.h"
#include "mcp/FrameCodec.h"

/**
 * @brief JSON-RPC 请求/响应关联表
 *
 * - 单调递增的整数 id,只在请求未完成期间唯一
 * - 响应按 id 匹配,不依赖到达顺序
 * - 每个请求恰好结算一次: 匹配响应、超时或 failAll 三者之一
 * - 迟到的响应 (已超时的 id) 作为未知 id 记录后忽略
 */
class RpcChannel {
public:
    using Writer = std::function<void(const std::string& frame)>;
    using ResultHandler = std::function<void(const nlohmann::json& result)>;
    using ErrorHandler = std::function<void(std::exception_ptr error)>;

    explicit RpcChannel(EventLoop& loop, std::unique_ptr<FrameCodec> codec = nullptr);
    ~RpcChannel();

    RpcChannel(const RpcChannel&) = delete;
    RpcChannel& operator=(const RpcChannel&) = delete;

    void setWriter(Writer writer) { this->writer = std::move(writer); }

    /**
     * @brief 发送请求并登记待结算项
     * @return 分配的请求 id
     *
     * 写入失败时不登记,异常直接抛给调用方。
     */
    int request(const std::string& method, const nlohmann::json& params,
                ResultHandler onResult, ErrorHandler onError,
                std::chrono::milliseconds timeout);

    void notify(const std::string& method, const nlohmann::json& params);

    // Inbound bytes from the peer.
    void feed(const char* data, size_t size);

    // Rejects every outstanding request with ProcessTerminated(reason).
    void failAll(const std::string& reason);

    // failAll plus dropping any partially received frame.
    void reset(const std::string& reason);

    size_t pendingCount() const { return pending.size(); }
    bool isPending(int id) const { return pending.count(id) > 0; }
    int lastRequestId() const { return nextId; }

private:
    struct PendingRequest {
        int id;
        std::string method;
        ResultHandler onResult;
        ErrorHandler onError;
        EventLoop::TimerId timer;
        EventLoop::Clock::time_point startedAt;
    };

    EventLoop& loop;
    std::unique_ptr<FrameCodec> codec;
    Writer writer;
    int nextId = 0;
    std::unordered_map<int, PendingRequest> pending;

    void handleFrame(const std::string& frame);
    void dispatch(const nlohmann::json& message);
    void onTimeout(int id);
};
