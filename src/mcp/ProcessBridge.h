#pragma once
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <sys/types.h>
#include "core/EventLoop.h"
#include "mcp/IToolBridge.h"
#include "mcp/RpcChannel.h"
#include "mcp/ToolPolicy.h"

#ifndef FERRY_VERSION
#define FERRY_VERSION "0.1.0"
#endif

struct LaunchCommand {
    std::string program;
    std::vector<std::string> args;

    bool empty() const { return program.empty(); }
    std::string toString() const;
};

struct BridgeSettings {
    // Explicit launch command; takes precedence over serverDir and PATH lookup
    std::string command;
    std::vector<std::string> commandArgs;
    // Checkout of the tool server: dist/bin.js, then src/bin.ts
    std::string serverDir;
    std::string globalCommand = "mcp-webgal";

    std::chrono::milliseconds requestTimeout{60000};
    std::chrono::milliseconds stopGrace{5000};
    std::chrono::milliseconds emptyCatalogRetryDelay{500};
    std::chrono::milliseconds exitPollInterval{250};
};

struct StartOptions {
    bool enableExec = false;
    bool enableBrowser = false;
};

struct BridgeStatus {
    bool running = false;
    std::string projectRoot;
    std::vector<ToolDescriptor> tools;

    nlohmann::json toJson() const;
};

/**
 * @brief 工具服务器子进程桥
 *
 * 持有子进程,通过 stdin/stdout 以换行分隔的 JSON-RPC 通信:
 * - start(): 先停掉旧进程,再启动、握手 (initialize)、拉取工具目录
 * - call()/callTool(): 按 id 关联响应,单次调用各自超时
 * - 进程退出或出错时立即让所有待结算请求失败,不自动重启
 *
 * 同一实例任何时刻最多一个存活子进程。
 */
class ProcessBridge : public IToolBridge {
public:
    ProcessBridge(EventLoop& loop, BridgeSettings settings = {}, ToolPolicy policy = {});
    ~ProcessBridge() override;

    ProcessBridge(const ProcessBridge&) = delete;
    ProcessBridge& operator=(const ProcessBridge&) = delete;

    void start(const std::string& projectRoot, const StartOptions& options = {});
    void stop();

    nlohmann::json call(const std::string& method, const nlohmann::json& params = nlohmann::json::object());
    int callAsync(const std::string& method, const nlohmann::json& params,
                  RpcChannel::ResultHandler onResult, RpcChannel::ErrorHandler onError);

    nlohmann::json callTool(const std::string& name, const nlohmann::json& arguments) override;

    bool isRunning() const override { return childPid > 0; }
    std::vector<ToolDescriptor> listTools() const override { return tools; }
    BridgeStatus getStatus() const;

    bool isInitialized() const { return initialized; }
    pid_t getPid() const { return childPid; }
    const nlohmann::json& getServerInfo() const { return serverInfo; }
    size_t pendingCount() const { return channel.pendingCount(); }
    // Bytes waiting for the child's stdin to drain
    size_t queuedBytes() const { return outbox.size(); }

    LaunchCommand resolveLaunchCommand() const;

    /**
     * @brief 解包 tools/call 的响应信封
     *
     * result.content[0].text 本身是 JSON:
     * - {error:{code,message,hint?,details?}} -> ToolApplicationError
     * - 无法解析 -> 原样返回文本
     * - 没有 content -> 返回原始 result
     */
    static nlohmann::json unwrapToolResult(const std::string& toolName, const nlohmann::json& result);

private:
    EventLoop& loop;
    BridgeSettings settings;
    ToolPolicy policy;
    RpcChannel channel;

    pid_t childPid = -1;
    int stdinFd = -1;
    int stdoutFd = -1;
    int stderrFd = -1;
    EventLoop::TimerId exitWatchTimer = 0;
    std::string outbox;
    std::string stderrTail;

    std::string projectRoot;
    bool initialized = false;
    nlohmann::json serverInfo;
    std::vector<ToolDescriptor> tools;

    void spawn(const LaunchCommand& command, const std::string& workingDir);
    void initialize();
    void fetchTools();
    std::vector<ToolDescriptor> parseCatalog(const nlohmann::json& result) const;

    void writeFrame(const std::string& frame);
    void flushOutbox();
    void onStdoutReadable();
    void onStderrReadable();
    void scheduleExitCheck();
    void handleProcessExit(const std::string& reason);
    bool reapChild(std::chrono::milliseconds wait);
    void cleanup(const std::string& reason);
};
