#include "mcp/FrameCodec.h"
#include "utils/Logger.h"

namespace {
bool isBlank(const std::string& line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r') return false;
    }
    return true;
}
} // namespace

std::string LineFrameCodec::encode(const nlohmann::json& message) const {
    // dump() escapes control characters, so the frame never contains a raw newline
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

void LineFrameCodec::feed(const char* data, size_t size, const FrameHandler& onFrame) {
    if (size == 0) return;
    size_t oldSize = buffer.size();
    buffer.append(data, size);

    // only the appended bytes can hold a new line end
    if (buffer.find('\n', oldSize) == std::string::npos) {
        if (buffer.size() > kMaxFrameBytes) {
            Logger::getInstance().error("[Bridge] Dropping " + std::to_string(buffer.size()) +
                                        " bytes of unterminated frame data");
            buffer.clear();
        }
        return;
    }
    size_t lastNewline = buffer.rfind('\n');

    // Detach the complete lines first; handlers may reset the codec.
    std::string complete = buffer.substr(0, lastNewline + 1);
    buffer.erase(0, lastNewline + 1);

    size_t start = 0;
    while (start < complete.size()) {
        size_t newline = complete.find('\n', start);
        std::string line = complete.substr(start, newline - start);
        start = newline + 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (isBlank(line)) continue;
        onFrame(line);
    }
}
