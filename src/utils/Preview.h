#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace Preview {

constexpr size_t kMaxChars = 200;

// Cuts text to at most maxChars UTF-8 characters, appending "..." when cut.
std::string truncate(const std::string& text, size_t maxChars = kMaxChars);

// Compact single-line rendering of tool arguments.
std::string arguments(const nlohmann::json& args, size_t maxChars = kMaxChars);

/**
 * @brief 按形状概括工具结果,从不完整序列化
 *
 * - 字符串: 截断后的文本
 * - 数组: "N items"
 * - 含 entries/files/items/... 数组的对象: "<key>: N items"
 * - 其它对象: 最多 6 个键名
 */
std::string result(const nlohmann::json& value, size_t maxChars = kMaxChars);

} // namespace Preview
