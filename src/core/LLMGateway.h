#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct LLMToolCall {
    std::string id;
    std::string name;
    std::string arguments;  // raw JSON text from the model, unparsed
};

struct LLMUsage {
    long long promptTokens = 0;
    long long completionTokens = 0;
    long long totalTokens = 0;

    void add(const LLMUsage& other) {
        promptTokens += other.promptTokens;
        completionTokens += other.completionTokens;
        totalTokens += other.totalTokens;
    }

    nlohmann::json toJson() const {
        return {
            {"prompt_tokens", promptTokens},
            {"completion_tokens", completionTokens},
            {"total_tokens", totalTokens}
        };
    }
};

struct LLMReply {
    std::string content;
    std::vector<LLMToolCall> toolCalls;
    LLMUsage usage;
};

struct HttpReply {
    int status = 0;          // 0: no response (connection failure, timeout)
    std::string body;
    std::string error;       // transport error description when status == 0
};

/**
 * @brief 模型网关: 一次 chat/completions 请求
 *
 * 失败分类:
 * - 未配置凭据: CredentialMissing, 不发请求
 * - 5xx / 429 / 连接失败: 本地重试 2 次 (500ms, 1500ms) 后抛 GatewayTransient
 * - 其它 4xx: 立即抛 GatewayPermanent
 */
class LLMGateway {
public:
    struct Options {
        std::string apiKey;
        std::string baseUrl = "https://api.deepseek.com/v1";
        std::string model = "deepseek-chat";
        double temperature = 0.3;
        int maxTokens = 2048;
        int connectTimeoutSec = 10;
        int readTimeoutSec = 60;
    };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit LLMGateway(Options options);
    virtual ~LLMGateway() = default;

    virtual LLMReply complete(const nlohmann::json& messages, const nlohmann::json& tools);

    void setSleeper(Sleeper sleeper) { this->sleeper = std::move(sleeper); }
    bool hasCredential() const { return !options.apiKey.empty(); }

    nlohmann::json buildRequestBody(const nlohmann::json& messages, const nlohmann::json& tools) const;

    // Flattens array content into strings and drops fields providers reject.
    static nlohmann::json normalizeMessages(const nlohmann::json& messages);

    static LLMReply parseReply(const nlohmann::json& body);

    static const std::vector<std::chrono::milliseconds>& retryBackoff();

protected:
    // One POST of body to <baseUrl><path>.
    virtual HttpReply post(const std::string& path, const std::string& body);

private:
    Options options;
    Sleeper sleeper;
    bool isSsl = true;
    std::string host;
    int port = 443;
    std::string pathPrefix;

    void parseBaseUrl(const std::string& url);
    static std::string describeFailure(const HttpReply& reply);
};
