#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 报文分帧接口
 *
 * 关联逻辑 (RpcChannel) 只依赖这个接口,分帧方案可以替换
 * 而不影响请求/响应的匹配。
 */
class FrameCodec {
public:
    using FrameHandler = std::function<void(const std::string& frame)>;

    virtual ~FrameCodec() = default;

    // Serializes one message into a complete frame.
    virtual std::string encode(const nlohmann::json& message) const = 0;

    // Appends bytes and emits every complete frame, in order.
    virtual void feed(const char* data, size_t size, const FrameHandler& onFrame) = 0;

    virtual void reset() = 0;

    // Bytes held back as an incomplete frame
    virtual size_t buffered() const = 0;
};

/**
 * Newline-delimited JSON: one object per line, no embedded newlines.
 * Accepts both "\n" and "\r\n"; blank lines are skipped.
 */
class LineFrameCodec : public FrameCodec {
public:
    // An unterminated fragment larger than this is discarded.
    static constexpr size_t kMaxFrameBytes = 64 * 1024 * 1024;

    std::string encode(const nlohmann::json& message) const override;
    void feed(const char* data, size_t size, const FrameHandler& onFrame) override;
    void reset() override { buffer.clear(); }
    size_t buffered() const override { return buffer.size(); }

private:
    std::string buffer;
};
