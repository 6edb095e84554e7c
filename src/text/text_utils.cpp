#include "internal/text/text_utils.hpp"

#include <cstddef>

#include <string>
#include <unordered_set>
#include <vector>

namespace sonata {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

size_t utf8CharLength(unsigned char lead) {
    if ((lead & 0x80) == 0) {
        return 1;  // ASCII
    } else if ((lead & 0xE0) == 0xC0) {
        return 2;  // 2-byte UTF-8
    } else if ((lead & 0xF0) == 0xE0) {
        return 3;  // 3-byte UTF-8
    } else if ((lead & 0xF8) == 0xF0) {
        return 4;  // 4-byte UTF-8
    }
    return 1;  // 非法首字节, 按单字节处理, 不丢弃
}

std::vector<std::string> splitUtf8(const std::string& str) {
    std::vector<std::string> result;
    for (size_t i = 0; i < str.length();) {
        size_t char_len = utf8CharLength(static_cast<unsigned char>(str[i]));
        if (i + char_len > str.length()) {
            char_len = str.length() - i;  // 截断的尾部字符原样保留
        }
        result.push_back(str.substr(i, char_len));
        i += char_len;
    }
    return result;
}

size_t utf8Length(const std::string& str) {
    size_t count = 0;
    for (size_t i = 0; i < str.length(); ++count) {
        i += utf8CharLength(static_cast<unsigned char>(str[i]));
    }
    return count;
}

std::u32string decodeUtf8(const std::string& str) {
    std::u32string result;
    result.reserve(str.length());

    size_t i = 0;
    while (i < str.length()) {
        unsigned char lead = static_cast<unsigned char>(str[i]);
        size_t len = utf8CharLength(lead);
        if (len == 1 || i + len > str.length()) {
            result.push_back(static_cast<char32_t>(lead));
            i++;
            continue;
        }

        char32_t cp = lead & (0xFF >> (len + 1));
        for (size_t k = 1; k < len; ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(str[i + k]) & 0x3F);
        }
        result.push_back(cp);
        i += len;
    }
    return result;
}

std::string encodeUtf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

// =============================================================================
// 空白处理
// =============================================================================

bool isWhitespace(const std::string& ch) {
    if (ch.length() == 1) {
        char c = ch[0];
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }
    return ch == "\xe3\x80\x80";  // U+3000 全角空格
}

std::string trim(const std::string& str) {
    auto chars = splitUtf8(str);
    size_t begin = 0;
    size_t end = chars.size();
    while (begin < end && isWhitespace(chars[begin])) ++begin;
    while (end > begin && isWhitespace(chars[end - 1])) --end;

    std::string result;
    for (size_t i = begin; i < end; ++i) {
        result += chars[i];
    }
    return result;
}

std::string collapseWhitespace(const std::string& str) {
    std::string result;
    bool pending_space = false;
    for (const auto& ch : splitUtf8(str)) {
        if (isWhitespace(ch)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += ch;
    }
    return result;
}

bool isBlank(const std::string& str) {
    for (const auto& ch : splitUtf8(str)) {
        if (!isWhitespace(ch)) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// 标点符号处理
// =============================================================================

bool isSentenceTerminator(const std::string& ch) {
    if (ch.size() == 1) {
        static const std::string en_puncts = ".!?;";
        return en_puncts.find(ch[0]) != std::string::npos;
    }
    return isFullWidthTerminator(ch);
}

bool isFullWidthTerminator(const std::string& ch) {
    static const std::unordered_set<std::string> cn_puncts = {
        "。", "！", "？", "；"
    };
    return cn_puncts.count(ch) > 0;
}

bool isClosingPunctuation(const std::string& ch) {
    static const std::unordered_set<std::string> closers = {
        "\"", "'", ")", "]", "}",
        "\xe2\x80\x9d",  // U+201D
        "\xe2\x80\x99",  // U+2019
        "）", "】", "》", "」", "』"
    };
    return closers.count(ch) > 0;
}

}  // namespace text
}  // namespace sonata
