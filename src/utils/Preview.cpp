#include "utils/Preview.h"
#include <array>

namespace Preview {

namespace {
constexpr size_t kMaxKeys = 6;

const std::array<const char*, 7> kCollectionKeys = {
    "entries", "files", "items", "resources", "snapshots", "matches", "results"
};

// Length of the UTF-8 sequence starting with lead byte c; stray continuation bytes count as 1.
size_t sequenceLength(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}
} // namespace

std::string truncate(const std::string& text, size_t maxChars) {
    size_t pos = 0;
    size_t chars = 0;
    while (pos < text.size() && chars < maxChars) {
        size_t len = sequenceLength(static_cast<unsigned char>(text[pos]));
        if (pos + len > text.size()) break;
        pos += len;
        ++chars;
    }
    if (pos >= text.size()) return text;
    return text.substr(0, pos) + "...";
}

std::string arguments(const nlohmann::json& args, size_t maxChars) {
    if (args.is_null()) return "{}";
    return truncate(args.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), maxChars);
}

std::string result(const nlohmann::json& value, size_t maxChars) {
    if (value.is_string()) {
        return truncate(value.get<std::string>(), maxChars);
    }
    if (value.is_array()) {
        return std::to_string(value.size()) + " items";
    }
    if (value.is_object()) {
        for (const char* key : kCollectionKeys) {
            auto it = value.find(key);
            if (it != value.end() && it->is_array()) {
                return std::string(key) + ": " + std::to_string(it->size()) + " items";
            }
        }

        std::string keys;
        size_t count = 0;
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (count == kMaxKeys) {
                keys += ", ...";
                break;
            }
            if (count > 0) keys += ", ";
            keys += it.key();
            ++count;
        }
        return truncate("{" + keys + "}", maxChars);
    }
    if (value.is_null()) return "(empty)";
    return truncate(value.dump(), maxChars);
}

} // namespace Preview
