#ifndef SONATA_TEXT_UTILS_HPP
#define SONATA_TEXT_UTILS_HPP

/**
 * TextUtils - 文本处理工具模块
 *
 * 提供 UTF-8 字符串处理、空白处理、句末标点判断等功能。
 */

#include <cstddef>

#include <string>
#include <vector>

namespace sonata {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

/**
 * @brief 根据首字节获取 UTF-8 字符长度
 * @param lead 首字节
 * @return 字节数 [1, 4], 非法首字节按 1 处理
 */
size_t utf8CharLength(unsigned char lead);

/**
 * @brief 将 UTF-8 字符串分割为单个字符
 * @param str UTF-8 编码的字符串
 * @return 每个 UTF-8 字符组成的向量
 */
std::vector<std::string> splitUtf8(const std::string& str);

/**
 * @brief 统计 UTF-8 字符数
 * @param str UTF-8 编码的字符串
 * @return 字符数
 */
size_t utf8Length(const std::string& str);

/**
 * @brief 解码为 Unicode 码点序列 (非法字节按原值保留)
 * @param str UTF-8 编码的字符串
 * @return 码点序列
 */
std::u32string decodeUtf8(const std::string& str);

/**
 * @brief 将单个码点编码为 UTF-8
 */
std::string encodeUtf8(char32_t codepoint);

// =============================================================================
// 空白处理
// =============================================================================

/**
 * @brief 判断是否为空白字符 (ASCII 空白与全角空格 U+3000)
 * @param ch UTF-8 编码的单个字符
 */
bool isWhitespace(const std::string& ch);

/**
 * @brief 去除首尾空白
 */
std::string trim(const std::string& str);

/**
 * @brief 去除首尾空白, 并将内部连续空白折叠为单个空格
 */
std::string collapseWhitespace(const std::string& str);

/**
 * @brief 判断字符串去除空白后是否为空
 */
bool isBlank(const std::string& str);

// =============================================================================
// 标点符号处理
// =============================================================================

/**
 * @brief 判断是否为句末标点 (. ! ? ; 。 ！ ？ ；)
 * @param ch UTF-8 编码的单个字符
 */
bool isSentenceTerminator(const std::string& ch);

/**
 * @brief 判断是否为收尾引号或括号, 跟随句末标点归入同一句
 * @param ch UTF-8 编码的单个字符
 */
bool isClosingPunctuation(const std::string& ch);

/**
 * @brief 判断是否为全角句末标点 (其后无需空白即可断句)
 * @param ch UTF-8 编码的单个字符
 */
bool isFullWidthTerminator(const std::string& ch);

}  // namespace text
}  // namespace sonata

#endif  // SONATA_TEXT_UTILS_HPP
