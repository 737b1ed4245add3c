#include "mcp/ProcessBridge.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) return;
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void setCloseOnExec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) return;
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void closePipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

std::string describeExit(int status) {
    if (WIFEXITED(status)) return "code " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return "signal " + std::to_string(WTERMSIG(status));
    return "status " + std::to_string(status);
}

std::string stringField(const nlohmann::json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    return it->is_string() ? it->get<std::string>() : it->dump();
}

long long msSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}
} // namespace

std::string LaunchCommand::toString() const {
    std::string out = program;
    for (const auto& arg : args) {
        out += " " + arg;
    }
    return out;
}

nlohmann::json BridgeStatus::toJson() const {
    nlohmann::json toolList = nlohmann::json::array();
    for (const auto& tool : tools) {
        toolList.push_back(tool.toJson());
    }
    nlohmann::json out = {{"running", running}, {"tools", toolList}};
    out["projectRoot"] = projectRoot.empty() ? nlohmann::json() : nlohmann::json(projectRoot);
    return out;
}

ProcessBridge::ProcessBridge(EventLoop& loop, BridgeSettings settings, ToolPolicy policy)
    : loop(loop), settings(std::move(settings)), policy(std::move(policy)), channel(loop) {
    // A dead child must surface as EPIPE on write, not kill us.
    std::signal(SIGPIPE, SIG_IGN);
}

ProcessBridge::~ProcessBridge() {
    stop();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

LaunchCommand ProcessBridge::resolveLaunchCommand() const {
    auto& logger = Logger::getInstance();
    if (!settings.command.empty()) {
        return {settings.command, settings.commandArgs};
    }

    if (!settings.serverDir.empty()) {
        std::error_code ec;
        fs::path dir = fs::u8path(settings.serverDir);

        // Prefer the built dist/bin.js
        fs::path compiled = dir / "dist" / "bin.js";
        if (fs::exists(compiled, ec)) {
            logger.info("[Bridge] Using compiled tool server: " + compiled.string());
            return {"node", {compiled.string()}};
        }
        fs::path source = dir / "src" / "bin.ts";
        if (fs::exists(source, ec)) {
            logger.info("[Bridge] Using tool server source: " + source.string());
            return {"npx", {"-y", "tsx", source.string()}};
        }
    }

    logger.warn("[Bridge] Tool server not found in expected locations, trying globally installed " +
                settings.globalCommand);
    return {settings.globalCommand, {}};
}

void ProcessBridge::start(const std::string& root, const StartOptions& options) {
    auto& logger = Logger::getInstance();
    if (isRunning()) {
        logger.warn("[Bridge] Tool server already running, stopping first");
        stop();
    }

    LaunchCommand command = resolveLaunchCommand();
    if (command.empty()) {
        throw ProcessTerminated("Tool server executable not found");
    }
    command.args.push_back("--project");
    command.args.push_back(root);
    if (options.enableExec) {
        command.args.push_back("--enable-exec");
    }
    if (options.enableBrowser) {
        command.args.push_back("--enable-browser");
    }

    logger.info("[Bridge] Starting tool server: " + command.toString());
    spawn(command, root);
    projectRoot = root;

    try {
        initialize();
    } catch (const FerryError& e) {
        logger.error(std::string("[Bridge] Initialization failed: ") + e.what());
        stop();
        throw ProcessTerminated(std::string("Failed to initialize tool server: ") + e.what());
    }

    fetchTools();
}

void ProcessBridge::spawn(const LaunchCommand& command, const std::string& workingDir) {
    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe(inPipe) != 0) {
        throw ProcessTerminated(std::string("Failed to create stdin pipe: ") + std::strerror(errno));
    }
    if (pipe(outPipe) != 0) {
        closePipe(inPipe);
        throw ProcessTerminated(std::string("Failed to create stdout pipe: ") + std::strerror(errno));
    }
    if (pipe(errPipe) != 0) {
        closePipe(inPipe);
        closePipe(outPipe);
        throw ProcessTerminated(std::string("Failed to create stderr pipe: ") + std::strerror(errno));
    }
    for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) {
        setCloseOnExec(fd);
    }

    std::vector<std::string> argvStrings;
    argvStrings.push_back(command.program);
    argvStrings.insert(argvStrings.end(), command.args.begin(), command.args.end());
    std::vector<char*> argv;
    argv.reserve(argvStrings.size() + 1);
    for (auto& arg : argvStrings) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        closePipe(inPipe);
        closePipe(outPipe);
        closePipe(errPipe);
        throw ProcessTerminated(std::string("Failed to fork tool server: ") + std::strerror(errno));
    }

    if (pid == 0) {
        if (!workingDir.empty() && chdir(workingDir.c_str()) != 0) {
            _exit(126);
        }
        // dup2 clears FD_CLOEXEC on the standard descriptors only
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        setenv("NODE_ENV", "production", 1);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    close(inPipe[0]);
    close(outPipe[1]);
    close(errPipe[1]);
    stdinFd = inPipe[1];
    stdoutFd = outPipe[0];
    stderrFd = errPipe[0];
    setNonBlocking(stdinFd);
    setNonBlocking(stdoutFd);
    setNonBlocking(stderrFd);
    childPid = pid;

    loop.watchFd(stdoutFd, POLLIN, [this](short) { onStdoutReadable(); });
    loop.watchFd(stderrFd, POLLIN, [this](short) { onStderrReadable(); });
    channel.setWriter([this](const std::string& frame) { writeFrame(frame); });
    scheduleExitCheck();

    Logger::getInstance().debug("[Bridge] Tool server pid " + std::to_string(pid));
}

void ProcessBridge::initialize() {
    if (initialized) return;

    auto& logger = Logger::getInstance();
    logger.info("[Bridge] Initializing tool server connection...");

    nlohmann::json params = {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "ferry"}, {"version", FERRY_VERSION}}}
    };
    serverInfo = call("initialize", params);
    channel.notify("notifications/initialized", nlohmann::json::object());
    initialized = true;

    logger.info("[Bridge] Tool server initialized. Server info: " + serverInfo.dump());
}

std::vector<ToolDescriptor> ProcessBridge::parseCatalog(const nlohmann::json& result) const {
    std::vector<ToolDescriptor> catalog;
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return catalog;
    }
    for (const auto& tool : result["tools"]) {
        if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string()) {
            Logger::getInstance().warn("[Bridge] Skipping malformed tool entry: " + tool.dump());
            continue;
        }
        catalog.push_back(policy.describe(tool));
    }
    return catalog;
}

void ProcessBridge::fetchTools() {
    auto& logger = Logger::getInstance();
    try {
        tools = parseCatalog(call("tools/list"));
        logger.info("[Bridge] Fetched " + std::to_string(tools.size()) + " tools");

        if (tools.empty()) {
            logger.warn("[Bridge] Tool list is empty, retrying...");
            loop.sleepFor(settings.emptyCatalogRetryDelay);
            tools = parseCatalog(call("tools/list"));
            logger.info("[Bridge] Retry: fetched " + std::to_string(tools.size()) + " tools");
        }
    } catch (const FerryError& e) {
        logger.error(std::string("[Bridge] Failed to fetch tools: ") + e.what());
        tools.clear();
    }
}

void ProcessBridge::stop() {
    if (childPid <= 0) {
        return;
    }

    auto& logger = Logger::getInstance();
    logger.info("[Bridge] Stopping tool server (pid " + std::to_string(childPid) + ")");
    kill(childPid, SIGTERM);

    if (!reapChild(settings.stopGrace)) {
        logger.warn("[Bridge] Tool server ignored SIGTERM, killing");
        kill(childPid, SIGKILL);
        int status = 0;
        waitpid(childPid, &status, 0);
    }

    cleanup("Tool server process terminated");
}

bool ProcessBridge::reapChild(std::chrono::milliseconds wait) {
    auto deadline = std::chrono::steady_clock::now() + wait;
    while (true) {
        int status = 0;
        pid_t r = waitpid(childPid, &status, WNOHANG);
        if (r == childPid) {
            Logger::getInstance().info("[Bridge] Tool server exited with " + describeExit(status));
            return true;
        }
        if (r < 0 && errno != EINTR) {
            // ECHILD: already reaped elsewhere
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ProcessBridge::scheduleExitCheck() {
    exitWatchTimer = loop.runAfter(settings.exitPollInterval, [this] {
        exitWatchTimer = 0;
        if (childPid <= 0) return;

        int status = 0;
        pid_t r = waitpid(childPid, &status, WNOHANG);
        if (r == childPid) {
            Logger::getInstance().info("[Bridge] Tool server exited with " + describeExit(status));
            // already reaped; deliver what the child wrote before exiting
            childPid = -1;
            onStdoutReadable();
            cleanup("Tool server process terminated");
            return;
        }
        scheduleExitCheck();
    });
}

void ProcessBridge::handleProcessExit(const std::string& reason) {
    if (childPid <= 0) return;

    Logger::getInstance().warn("[Bridge] Tool server process lost: " + reason);
    // stdout is gone, so the process is of no further use
    if (!reapChild(std::chrono::milliseconds(200))) {
        kill(childPid, SIGKILL);
        int status = 0;
        waitpid(childPid, &status, 0);
    }
    cleanup("Tool server process terminated");
}

void ProcessBridge::cleanup(const std::string& reason) {
    if (exitWatchTimer != 0) {
        loop.cancelTimer(exitWatchTimer);
        exitWatchTimer = 0;
    }
    for (int* fd : {&stdinFd, &stdoutFd, &stderrFd}) {
        if (*fd >= 0) {
            loop.unwatchFd(*fd);
            close(*fd);
            *fd = -1;
        }
    }

    childPid = -1;
    outbox.clear();
    stderrTail.clear();
    projectRoot.clear();
    tools.clear();
    initialized = false;
    serverInfo = nullptr;

    channel.setWriter(nullptr);
    channel.reset(reason);
}

// ---------------------------------------------------------------------------
// I/O
// ---------------------------------------------------------------------------

void ProcessBridge::writeFrame(const std::string& frame) {
    if (stdinFd < 0) {
        throw ProcessTerminated("Tool server process not running");
    }
    if (!outbox.empty()) {
        // keep frame order behind the queued bytes
        outbox += frame;
        return;
    }

    size_t written = 0;
    while (written < frame.size()) {
        ssize_t n = write(stdinFd, frame.data() + written, frame.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        throw ProcessTerminated(std::string("Failed to write to tool server: ") + std::strerror(errno));
    }

    if (written < frame.size()) {
        outbox.append(frame, written, std::string::npos);
        Logger::getInstance().debug("[Bridge] stdin is full, " + std::to_string(outbox.size()) +
                                    " bytes waiting for drain");
        loop.watchFd(stdinFd, POLLOUT, [this](short) { flushOutbox(); });
    }
}

void ProcessBridge::flushOutbox() {
    while (!outbox.empty()) {
        ssize_t n = write(stdinFd, outbox.data(), outbox.size());
        if (n > 0) {
            outbox.erase(0, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;

        handleProcessExit(std::string("stdin write failed: ") + std::strerror(errno));
        return;
    }
    loop.unwatchFd(stdinFd);
    Logger::getInstance().debug("[Bridge] stdin drained, ready for more writes");
}

void ProcessBridge::onStdoutReadable() {
    char buffer[8192];
    while (stdoutFd >= 0) {
        ssize_t n = read(stdoutFd, buffer, sizeof(buffer));
        if (n > 0) {
            channel.feed(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            handleProcessExit("stdout closed");
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        handleProcessExit(std::string("stdout read failed: ") + std::strerror(errno));
        return;
    }
}

void ProcessBridge::onStderrReadable() {
    char buffer[4096];
    while (stderrFd >= 0) {
        ssize_t n = read(stderrFd, buffer, sizeof(buffer));
        if (n > 0) {
            stderrTail.append(buffer, static_cast<size_t>(n));
            size_t newline;
            while ((newline = stderrTail.find('\n')) != std::string::npos) {
                std::string line = stderrTail.substr(0, newline);
                stderrTail.erase(0, newline + 1);
                if (!line.empty()) {
                    Logger::getInstance().debug("[Bridge] tool server stderr: " + line);
                }
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        // EOF or error: stop watching; exit detection relies on stdout and waitpid
        loop.unwatchFd(stderrFd);
        close(stderrFd);
        stderrFd = -1;
        return;
    }
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

int ProcessBridge::callAsync(const std::string& method, const nlohmann::json& params,
                             RpcChannel::ResultHandler onResult, RpcChannel::ErrorHandler onError) {
    if (!isRunning()) {
        throw ProcessTerminated("Tool server process not running");
    }
    return channel.request(method, params, std::move(onResult), std::move(onError), settings.requestTimeout);
}

nlohmann::json ProcessBridge::call(const std::string& method, const nlohmann::json& params) {
    struct CallState {
        bool settled = false;
        nlohmann::json result;
        std::exception_ptr error;
    };
    auto state = std::make_shared<CallState>();

    callAsync(method, params,
        [state](const nlohmann::json& result) {
            state->result = result;
            state->settled = true;
        },
        [state](std::exception_ptr error) {
            state->error = error;
            state->settled = true;
        });

    if (!loop.runUntil([&state] { return state->settled; })) {
        throw ProcessTerminated("Event loop went idle while waiting for " + method);
    }
    if (state->error) {
        std::rethrow_exception(state->error);
    }
    return state->result;
}

nlohmann::json ProcessBridge::callTool(const std::string& name, const nlohmann::json& arguments) {
    if (!isRunning()) {
        throw ProcessTerminated("Tool server process not running");
    }

    auto& logger = Logger::getInstance();
    auto started = std::chrono::steady_clock::now();
    logger.action("[Bridge] tools/call " + name);

    nlohmann::json result;
    try {
        result = call("tools/call", {
            {"name", name},
            {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
        });
    } catch (const FerryError& e) {
        logger.error("[Bridge] Tool " + name + " error after " + std::to_string(msSince(started)) +
                     "ms: " + e.what());
        throw;
    }

    try {
        nlohmann::json payload = unwrapToolResult(name, result);
        logger.debug("[Bridge] Tool " + name + " succeeded in " + std::to_string(msSince(started)) + "ms");
        return payload;
    } catch (const ToolApplicationError& e) {
        logger.warn("[Bridge] Tool " + name + " failed in " + std::to_string(msSince(started)) +
                    "ms with code " + e.getCode() + ": " + e.what());
        throw;
    }
}

nlohmann::json ProcessBridge::unwrapToolResult(const std::string& toolName, const nlohmann::json& result) {
    if (!result.is_object()) return result;

    auto content = result.find("content");
    if (content == result.end() || !content->is_array() || content->empty()) {
        return result;
    }
    const auto& first = (*content)[0];
    if (!first.is_object() || !first.contains("text") || !first["text"].is_string()) {
        return result;
    }
    const std::string text = first["text"].get<std::string>();
    if (text.empty()) {
        return result;
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().warn("[Bridge] Failed to parse " + toolName + " result as JSON: " + e.what());
        return text;
    }

    if (parsed.is_object() && parsed.contains("error") && !parsed["error"].is_null()) {
        const auto& error = parsed["error"];
        if (!error.is_object()) {
            throw ToolApplicationError("E_INTERNAL",
                                       error.is_string() ? error.get<std::string>() : error.dump());
        }
        throw ToolApplicationError(
            stringField(error, "code", "E_INTERNAL"),
            stringField(error, "message", "Tool call failed"),
            stringField(error, "hint", ""),
            error.contains("details") ? error["details"] : nlohmann::json());
    }
    return parsed;
}

BridgeStatus ProcessBridge::getStatus() const {
    BridgeStatus status;
    status.running = isRunning();
    status.projectRoot = projectRoot;
    status.tools = tools;
    return status;
}
