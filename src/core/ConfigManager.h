#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>
#include <nlohmann/json.hpp>

struct Config {
    struct LLM {
        std::string apiKey;
        std::string baseUrl = "https://api.deepseek.com/v1";
        std::string model = "deepseek-chat";
        std::string systemRole =
            "You are a WebGAL script editing assistant. Answer concisely and concretely. "
            "Use the available tools to inspect the project before answering. "
            "Writes, replacements and snapshot restores are only proposed; the user confirms them separately.";
        double temperature = 0.3;
        int maxTokens = 2048;
    } llm;

    struct Agent {
        int maxSteps = 12;
        int maxRetries = 2;
        int retryDelayMs = 500;
        bool smartDetection = true;
        size_t maxHistory = 12;
        std::string defaultListRoot = "game";
        // Extra tool names treated as read-only on top of the built-in set
        std::vector<std::string> readOnlyTools;
    } agent;

    struct Bridge {
        // Explicit launch command; empty means resolve from serverDir / PATH
        std::string command;
        std::string serverDir;
        bool enableExec = false;
        bool enableBrowser = false;
        int requestTimeoutMs = 60000;
    } bridge;

    struct Log {
        std::string file = "ferry.log";
        std::string level = "warn";
    } log;

    /**
     * Missing file -> built-in defaults. A file that exists but does not
     * parse is an error.
     */
    static Config load(const std::string& pathStr) {
        Config cfg;
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        if (pathStr.empty() || !std::filesystem::exists(path)) {
            cfg.applyEnvironment();
            return cfg;
        }

        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        cfg = fromJson(j);
        cfg.applyEnvironment();
        return cfg;
    }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (!j.is_object()) return cfg;

        try {
            if (j.contains("llm")) {
                const auto& llm = j["llm"];
                cfg.llm.apiKey = llm.value("api_key", cfg.llm.apiKey);
                cfg.llm.baseUrl = llm.value("base_url", cfg.llm.baseUrl);
                cfg.llm.model = llm.value("model", cfg.llm.model);
                cfg.llm.systemRole = llm.value("system_role", cfg.llm.systemRole);
                cfg.llm.temperature = llm.value("temperature", cfg.llm.temperature);
                cfg.llm.maxTokens = llm.value("max_tokens", cfg.llm.maxTokens);
            }

            if (j.contains("agent")) {
                const auto& agent = j["agent"];
                cfg.agent.maxSteps = agent.value("max_steps", cfg.agent.maxSteps);
                cfg.agent.maxRetries = agent.value("max_retries", cfg.agent.maxRetries);
                cfg.agent.retryDelayMs = agent.value("retry_delay_ms", cfg.agent.retryDelayMs);
                cfg.agent.smartDetection = agent.value("smart_detection", cfg.agent.smartDetection);
                cfg.agent.maxHistory = agent.value("max_history", cfg.agent.maxHistory);
                cfg.agent.defaultListRoot = agent.value("default_list_root", cfg.agent.defaultListRoot);
                if (agent.contains("read_only_tools")) {
                    cfg.agent.readOnlyTools = agent["read_only_tools"].get<std::vector<std::string>>();
                }
            }

            if (j.contains("bridge")) {
                const auto& bridge = j["bridge"];
                cfg.bridge.command = bridge.value("command", cfg.bridge.command);
                cfg.bridge.serverDir = bridge.value("server_dir", cfg.bridge.serverDir);
                cfg.bridge.enableExec = bridge.value("enable_exec", cfg.bridge.enableExec);
                cfg.bridge.enableBrowser = bridge.value("enable_browser", cfg.bridge.enableBrowser);
                cfg.bridge.requestTimeoutMs = bridge.value("request_timeout_ms", cfg.bridge.requestTimeoutMs);
            }

            if (j.contains("log")) {
                cfg.log.file = j["log"].value("file", cfg.log.file);
                cfg.log.level = j["log"].value("level", cfg.log.level);
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid config value: ") + e.what());
        }

        return cfg;
    }

    // FERRY_API_KEY wins over DEEPSEEK_API_KEY; both only fill an empty key.
    void applyEnvironment() {
        if (llm.apiKey.empty()) {
            if (const char* key = std::getenv("FERRY_API_KEY")) {
                llm.apiKey = key;
            } else if (const char* legacy = std::getenv("DEEPSEEK_API_KEY")) {
                llm.apiKey = legacy;
            }
        }
        if (const char* baseUrl = std::getenv("FERRY_BASE_URL")) {
            llm.baseUrl = baseUrl;
        }
        if (const char* model = std::getenv("FERRY_MODEL")) {
            llm.model = model;
        }
    }
};
