#include "internal/text/text_segmenter.hpp"

#include <cstddef>

#include <string>
#include <utility>
#include <vector>

#include "internal/text/text_utils.hpp"

namespace sonata {
namespace text {

namespace {

// 取 pos 处的单个 UTF-8 字符
std::string charAt(const std::string& str, size_t pos) {
    size_t len = utf8CharLength(static_cast<unsigned char>(str[pos]));
    if (pos + len > str.size()) {
        len = str.size() - pos;
    }
    return str.substr(pos, len);
}

}  // namespace

// =============================================================================
// SegmentSequence 实现
// =============================================================================

SegmentSequence::SegmentSequence(std::string text)
    : text_(std::move(text)) {
}

size_t SegmentSequence::skipWhitespace(size_t pos) const {
    while (pos < text_.size()) {
        std::string ch = charAt(text_, pos);
        if (!isWhitespace(ch)) {
            break;
        }
        pos += ch.size();
    }
    return pos;
}

size_t SegmentSequence::findBoundary(size_t start) const {
    size_t pos = start;
    while (pos < text_.size()) {
        std::string ch = charAt(text_, pos);

        if (isSentenceTerminator(ch)) {
            // 连续句末标点与收尾引号归入同一句
            bool full_width = isFullWidthTerminator(ch);
            size_t end = pos + ch.size();
            while (end < text_.size()) {
                std::string next = charAt(text_, end);
                if (isSentenceTerminator(next)) {
                    full_width = full_width || isFullWidthTerminator(next);
                } else if (!isClosingPunctuation(next)) {
                    break;
                }
                end += next.size();
            }
            if (end >= text_.size() || full_width || isWhitespace(charAt(text_, end))) {
                return end;
            }
            pos = end;
            continue;
        }

        if (ch == "\n") {
            // 段落: 空白中出现两个及以上换行
            size_t end = pos;
            int newlines = 0;
            while (end < text_.size()) {
                std::string next = charAt(text_, end);
                if (!isWhitespace(next)) break;
                if (next == "\n") ++newlines;
                end += next.size();
            }
            if (newlines >= 2) {
                return pos;
            }
            pos = end;
            continue;
        }

        pos += ch.size();
    }
    return text_.size();
}

bool SegmentSequence::next(Segment& segment) {
    size_t start = skipWhitespace(position_);
    if (start >= text_.size()) {
        position_ = text_.size();
        return false;
    }

    size_t boundary = findBoundary(start);
    std::string span = text_.substr(start, boundary - start);
    std::string trimmed = trim(span);

    segment.index = next_index_++;
    segment.text = collapseWhitespace(trimmed);
    segment.source_offset = start;
    segment.source_length = trimmed.size();

    position_ = boundary;
    return true;
}

bool SegmentSequence::hasNext() const {
    return skipWhitespace(position_) < text_.size();
}

void SegmentSequence::reset() {
    position_ = 0;
    next_index_ = 0;
}

std::vector<Segment> SegmentSequence::collect() const {
    SegmentSequence copy(text_);
    std::vector<Segment> segments;
    Segment segment;
    while (copy.next(segment)) {
        segments.push_back(segment);
    }
    return segments;
}

// =============================================================================
// 便捷函数
// =============================================================================

std::vector<Segment> segmentText(const std::string& text) {
    return SegmentSequence(text).collect();
}

}  // namespace text
}  // namespace sonata
