#include "core/LLMGateway.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <regex>
#include <thread>
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

namespace {
bool isTransient(const HttpReply& reply) {
    return reply.status == 0 || reply.status == 429 || reply.status >= 500;
}
} // namespace

LLMGateway::LLMGateway(Options options) : options(std::move(options)) {
    parseBaseUrl(this->options.baseUrl);
    sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

void LLMGateway::parseBaseUrl(const std::string& url) {
    std::regex urlRegex(R"((http|https)://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (std::regex_match(url, match, urlRegex)) {
        isSsl = (match[1] == "https");
        host = match[2];
        if (match[3].matched) {
            port = std::stoi(match[3]);
        } else {
            port = isSsl ? 443 : 80;
        }
        pathPrefix = match[4];
        while (!pathPrefix.empty() && pathPrefix.back() == '/') {
            pathPrefix.pop_back();
        }
    } else {
        // Bare host name
        isSsl = true;
        host = url;
        port = 443;
        pathPrefix = "";
    }
}

const std::vector<std::chrono::milliseconds>& LLMGateway::retryBackoff() {
    static const std::vector<std::chrono::milliseconds> backoff = {
        std::chrono::milliseconds(500),
        std::chrono::milliseconds(1500)
    };
    return backoff;
}

// ---------------------------------------------------------------------------
// Request normalization: some providers return assistant "content" as an array
// of parts ([{"type":"text","text":"..."}]) but reject that shape on requests.
// ---------------------------------------------------------------------------
nlohmann::json LLMGateway::normalizeMessages(const nlohmann::json& messages) {
    if (!messages.is_array()) return messages;
    nlohmann::json out = nlohmann::json::array();
    for (const auto& msg : messages) {
        if (!msg.is_object()) continue;
        nlohmann::json m = msg;
        if (m.contains("content")) {
            if (m["content"].is_null())
                m["content"] = "";
            else if (m["content"].is_array()) {
                std::string flat;
                for (const auto& part : m["content"]) {
                    if (part.is_object() && part.contains("text") && part["text"].is_string())
                        flat += part["text"].get<std::string>();
                }
                m["content"] = flat;
            }
        }
        if (m.contains("role") && m["role"] == "tool" && m.contains("name"))
            m.erase("name");
        out.push_back(m);
    }
    return out;
}

nlohmann::json LLMGateway::buildRequestBody(const nlohmann::json& messages, const nlohmann::json& tools) const {
    nlohmann::json body = {
        {"model", options.model},
        {"messages", normalizeMessages(messages)},
        {"temperature", options.temperature},
        {"max_tokens", options.maxTokens},
        {"stream", false}
    };
    if (tools.is_array() && !tools.empty()) {
        body["tools"] = tools;
    }
    return body;
}

LLMReply LLMGateway::parseReply(const nlohmann::json& body) {
    LLMReply reply;
    if (!body.is_object()) return reply;

    if (body.contains("choices") && body["choices"].is_array() && !body["choices"].empty()) {
        const auto& choice = body["choices"][0];
        nlohmann::json message = choice.is_object() && choice.contains("message") && choice["message"].is_object()
            ? choice["message"] : nlohmann::json::object();
        if (message.contains("content")) {
            const auto& content = message["content"];
            if (content.is_string()) {
                reply.content = content.get<std::string>();
            } else if (content.is_array()) {
                for (const auto& part : content) {
                    if (part.is_object() && part.contains("text") && part["text"].is_string())
                        reply.content += part["text"].get<std::string>();
                }
            }
        }

        if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
            for (const auto& call : message["tool_calls"]) {
                if (!call.is_object() || !call.contains("function") || !call["function"].is_object()) continue;
                const auto& function = call["function"];
                LLMToolCall toolCall;
                toolCall.id = call.contains("id") && call["id"].is_string() ? call["id"].get<std::string>() : "";
                if (function.contains("name") && function["name"].is_string()) {
                    toolCall.name = function["name"].get<std::string>();
                }
                if (function.contains("arguments")) {
                    const auto& args = function["arguments"];
                    toolCall.arguments = args.is_string() ? args.get<std::string>() : args.dump();
                }
                if (!toolCall.name.empty()) {
                    reply.toolCalls.push_back(std::move(toolCall));
                }
            }
        }
    }

    if (body.contains("usage") && body["usage"].is_object()) {
        const auto& usage = body["usage"];
        // some providers send null for counts they do not track
        auto count = [&usage](const char* key) -> long long {
            auto it = usage.find(key);
            return it != usage.end() && it->is_number_integer() ? it->get<long long>() : 0;
        };
        reply.usage.promptTokens = count("prompt_tokens");
        reply.usage.completionTokens = count("completion_tokens");
        reply.usage.totalTokens = count("total_tokens");
    }
    return reply;
}

std::string LLMGateway::describeFailure(const HttpReply& reply) {
    if (reply.status == 0) {
        return "connection failed" + (reply.error.empty() ? std::string() : ": " + reply.error);
    }
    std::string message;
    try {
        auto json = nlohmann::json::parse(reply.body);
        if (json.contains("error") && json["error"].is_object() &&
            json["error"].contains("message") && json["error"]["message"].is_string()) {
            message = json["error"]["message"].get<std::string>();
        }
    } catch (const nlohmann::json::parse_error&) {
        // body is not JSON; fall through to the status line
    }
    if (message.empty()) {
        message = reply.body.size() > 200 ? reply.body.substr(0, 200) + "..." : reply.body;
    }
    return "HTTP " + std::to_string(reply.status) + (message.empty() ? "" : ": " + message);
}

LLMReply LLMGateway::complete(const nlohmann::json& messages, const nlohmann::json& tools) {
    auto& logger = Logger::getInstance();
    if (!hasCredential()) {
        throw CredentialMissing("Provider API key is not set (FERRY_API_KEY / DEEPSEEK_API_KEY)");
    }

    const std::string endpoint = pathPrefix + "/chat/completions";
    const std::string bodyStr = buildRequestBody(messages, tools)
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const auto& backoff = retryBackoff();

    HttpReply reply;
    for (size_t attempt = 0; ; ++attempt) {
        reply = post(endpoint, bodyStr);
        if (reply.status >= 200 && reply.status < 300) break;

        if (!isTransient(reply)) {
            logger.error("[Gateway] Provider rejected request: " + describeFailure(reply));
            throw GatewayPermanent(reply.status, "Provider API error: " + describeFailure(reply));
        }
        if (attempt >= backoff.size()) {
            logger.error("[Gateway] Provider failed after " + std::to_string(attempt + 1) +
                         " attempts: " + describeFailure(reply));
            throw GatewayTransient(reply.status, "Provider API error: " + describeFailure(reply));
        }

        logger.warn("[Gateway] Request failed (" + describeFailure(reply) + "). Retrying (" +
                    std::to_string(attempt + 1) + "/" + std::to_string(backoff.size()) + ")...");
        sleeper(backoff[attempt]);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(reply.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw GatewayPermanent(reply.status, std::string("Provider returned invalid JSON: ") + e.what());
    }

    LLMReply result = parseReply(json);
    logger.debug("[Gateway] Reply with " + std::to_string(result.toolCalls.size()) + " tool call(s), " +
                 std::to_string(result.usage.totalTokens) + " tokens");
    return result;
}

HttpReply LLMGateway::post(const std::string& path, const std::string& body) {
    httplib::Headers headers = {
        {"Authorization", "Bearer " + options.apiKey}
    };

    auto send = [&](auto& cli) {
        cli.set_follow_location(true);
        cli.set_connection_timeout(options.connectTimeoutSec);
        cli.set_read_timeout(options.readTimeoutSec);

        HttpReply reply;
        auto res = cli.Post(path.c_str(), headers, body, "application/json");
        if (!res) {
            reply.error = httplib::to_string(res.error());
            return reply;
        }
        reply.status = res->status;
        reply.body = res->body;
        return reply;
    };

    if (isSsl) {
        httplib::SSLClient cli(host, port);
        return send(cli);
    }
    httplib::Client cli(host, port);
    return send(cli);
}
