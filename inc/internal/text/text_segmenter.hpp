#ifndef SONATA_TEXT_SEGMENTER_HPP
#define SONATA_TEXT_SEGMENTER_HPP

/**
 * TextSegmenter - 文本分段模块
 *
 * 将输入文本按句切分为有序、非空的分段, 每段独立送入模型合成。
 *
 * 断句规则:
 * - 句末标点 (. ! ? ;) 之后紧跟空白或文本结尾时断句, "3.14" 不断句
 * - 全角句末标点 (。！？；) 之后直接断句
 * - 连续句末标点 ("?!", "...") 与其后的收尾引号/括号归入同一句
 * - 两个及以上换行 (段落) 断句
 * - 最后一个句末标点之后的剩余文本作为最后一段
 *
 * 分段不会再拆分超长句子, 超长由模型以 SEGMENT_TOO_LARGE 报告。
 */

#include <cstddef>

#include <string>
#include <vector>

namespace sonata {
namespace text {

// =============================================================================
// Segment (分段)
// =============================================================================

struct Segment {
    size_t index = 0;               ///< 分段序号 (从 0 开始)
    std::string text;               ///< 折叠空白后的分段文本
    size_t source_offset = 0;       ///< 在原文中的字节偏移
    size_t source_length = 0;       ///< 在原文中的字节长度 (不含首尾空白)
};

// =============================================================================
// SegmentSequence (惰性分段序列 - 可重新开始)
// =============================================================================

class SegmentSequence {
public:
    explicit SegmentSequence(std::string text);

    /// @brief 取下一个分段
    /// @param segment [out] 分段
    /// @return false 表示已无分段
    bool next(Segment& segment);

    /// @brief 是否还有分段 (不推进)
    bool hasNext() const;

    /// @brief 回到文本开头
    void reset();

    /// @brief 从头物化全部分段 (不影响当前位置)
    std::vector<Segment> collect() const;

    /// @brief 原始文本
    const std::string& getText() const { return text_; }

private:
    /// 跳过空白, 返回下一个非空白字符的位置
    size_t skipWhitespace(size_t pos) const;

    /// 从 start 开始查找当前分段的结束位置 (不含)
    size_t findBoundary(size_t start) const;

    std::string text_;
    size_t position_ = 0;
    size_t next_index_ = 0;
};

// =============================================================================
// 便捷函数
// =============================================================================

/**
 * @brief 切分文本为分段列表
 * @param text 输入文本
 * @return 有序分段, 空白文本返回空列表
 */
std::vector<Segment> segmentText(const std::string& text);

}  // namespace text
}  // namespace sonata

#endif  // SONATA_TEXT_SEGMENTER_HPP
