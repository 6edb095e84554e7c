#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "internal/text/text_segmenter.hpp"
#include "internal/text/text_utils.hpp"

namespace sonata {
namespace text {
namespace {

std::vector<std::string> texts(const std::vector<Segment>& segments) {
    std::vector<std::string> result;
    for (const auto& segment : segments) {
        result.push_back(segment.text);
    }
    return result;
}

// =============================================================================
// 断句
// =============================================================================

TEST(TextSegmenterTest, SplitsOnSentenceTerminators) {
    auto segments = segmentText("Hello. World! How are you? Fine; thanks.");
    EXPECT_EQ(texts(segments),
              (std::vector<std::string>{"Hello.", "World!", "How are you?", "Fine;", "thanks."}));
}

TEST(TextSegmenterTest, IndicesFollowSourceOrder) {
    auto segments = segmentText("One. Two. Three.");
    ASSERT_EQ(segments.size(), 3u);
    for (size_t i = 0; i < segments.size(); ++i) {
        EXPECT_EQ(segments[i].index, i);
    }
}

TEST(TextSegmenterTest, DecimalPointIsNotABoundary) {
    auto segments = segmentText("Pi is 3.14 roughly. Next.");
    EXPECT_EQ(texts(segments), (std::vector<std::string>{"Pi is 3.14 roughly.", "Next."}));
}

TEST(TextSegmenterTest, TerminatorWithoutWhitespaceDoesNotSplit) {
    auto segments = segmentText("Visit example.com today");
    EXPECT_EQ(texts(segments), (std::vector<std::string>{"Visit example.com today"}));
}

TEST(TextSegmenterTest, TerminatorRunStaysTogether) {
    auto segments = segmentText("Really?! Yes... Sure.");
    EXPECT_EQ(texts(segments), (std::vector<std::string>{"Really?!", "Yes...", "Sure."}));
}

TEST(TextSegmenterTest, ClosingQuoteJoinsSentence) {
    auto segments = segmentText("He said \"Stop.\" Then he left.");
    EXPECT_EQ(texts(segments), (std::vector<std::string>{"He said \"Stop.\"", "Then he left."}));
}

TEST(TextSegmenterTest, FullWidthTerminatorsSplitWithoutWhitespace) {
    auto segments = segmentText("你好。世界！真的吗？");
    EXPECT_EQ(texts(segments), (std::vector<std::string>{"你好。", "世界！", "真的吗？"}));
}

TEST(TextSegmenterTest, FullWidthClosingQuote) {
    auto segments = segmentText("他说：“好。”然后走了。");
    EXPECT_EQ(texts(segments), (std::vector<std::string>{"他说：“好。”", "然后走了。"}));
}

TEST(TextSegmenterTest, ParagraphBreakSplits) {
    auto segments = segmentText("First paragraph\n\nSecond paragraph");
    EXPECT_EQ(texts(segments), (std::vector<std::string>{"First paragraph", "Second paragraph"}));
}

TEST(TextSegmenterTest, ParagraphBreakWithIndentedBlankLine) {
    auto segments = segmentText("First\n  \t\nSecond");
    EXPECT_EQ(texts(segments), (std::vector<std::string>{"First", "Second"}));
}

TEST(TextSegmenterTest, SingleNewlineIsCollapsed) {
    auto segments = segmentText("Line one\nline two.");
    EXPECT_EQ(texts(segments), (std::vector<std::string>{"Line one line two."}));
}

TEST(TextSegmenterTest, TrailingTextBecomesLastSegment) {
    auto segments = segmentText("Done. And then some");
    EXPECT_EQ(texts(segments), (std::vector<std::string>{"Done.", "And then some"}));
}

TEST(TextSegmenterTest, InternalWhitespaceIsCollapsed) {
    auto segments = segmentText("  Too    many \t spaces.  ");
    EXPECT_EQ(texts(segments), (std::vector<std::string>{"Too many spaces."}));
}

TEST(TextSegmenterTest, BlankTextHasNoSegments) {
    EXPECT_TRUE(segmentText("").empty());
    EXPECT_TRUE(segmentText("  \n\t ").empty());
    EXPECT_TRUE(segmentText("\xe3\x80\x80").empty());
}

TEST(TextSegmenterTest, SourceOffsetsPointIntoOriginal) {
    std::string input = "  Hi. There.";
    auto segments = segmentText(input);
    ASSERT_EQ(segments.size(), 2u);

    EXPECT_EQ(segments[0].source_offset, 2u);
    EXPECT_EQ(input.substr(segments[0].source_offset, segments[0].source_length), "Hi.");
    EXPECT_EQ(segments[1].source_offset, 6u);
    EXPECT_EQ(input.substr(segments[1].source_offset, segments[1].source_length), "There.");
}

TEST(TextSegmenterTest, NoSegmentIsEmpty) {
    auto segments = segmentText(". . ! ?\n\n\n;");
    for (const auto& segment : segments) {
        EXPECT_FALSE(segment.text.empty());
    }
}

// =============================================================================
// SegmentSequence (惰性)
// =============================================================================

TEST(SegmentSequenceTest, YieldsOneSegmentAtATime) {
    SegmentSequence sequence("A. B.");
    Segment segment;

    ASSERT_TRUE(sequence.hasNext());
    ASSERT_TRUE(sequence.next(segment));
    EXPECT_EQ(segment.text, "A.");
    EXPECT_EQ(segment.index, 0u);

    ASSERT_TRUE(sequence.hasNext());
    ASSERT_TRUE(sequence.next(segment));
    EXPECT_EQ(segment.text, "B.");
    EXPECT_EQ(segment.index, 1u);

    EXPECT_FALSE(sequence.hasNext());
    EXPECT_FALSE(sequence.next(segment));
}

TEST(SegmentSequenceTest, TrailingWhitespaceDoesNotCountAsSegment) {
    SegmentSequence sequence("Only one.   \n");
    Segment segment;
    ASSERT_TRUE(sequence.next(segment));
    EXPECT_FALSE(sequence.hasNext());
}

TEST(SegmentSequenceTest, ResetRestartsFromBeginning) {
    SegmentSequence sequence("A. B. C.");
    Segment segment;
    sequence.next(segment);
    sequence.next(segment);

    sequence.reset();
    ASSERT_TRUE(sequence.next(segment));
    EXPECT_EQ(segment.text, "A.");
    EXPECT_EQ(segment.index, 0u);
}

TEST(SegmentSequenceTest, CollectDoesNotMovePosition) {
    SegmentSequence sequence("A. B. C.");
    Segment segment;
    sequence.next(segment);

    EXPECT_EQ(sequence.collect().size(), 3u);

    ASSERT_TRUE(sequence.next(segment));
    EXPECT_EQ(segment.text, "B.");
}

TEST(SegmentSequenceTest, MatchesEagerSegmentation) {
    std::string input = "One. Two!\n\nThree? 四。五";
    SegmentSequence sequence(input);
    std::vector<Segment> lazy;
    Segment segment;
    while (sequence.next(segment)) {
        lazy.push_back(segment);
    }

    auto eager = segmentText(input);
    ASSERT_EQ(lazy.size(), eager.size());
    for (size_t i = 0; i < eager.size(); ++i) {
        EXPECT_EQ(lazy[i].text, eager[i].text);
        EXPECT_EQ(lazy[i].source_offset, eager[i].source_offset);
    }
}

// =============================================================================
// TextUtils
// =============================================================================

TEST(TextUtilsTest, Utf8Length) {
    EXPECT_EQ(utf8Length("abc"), 3u);
    EXPECT_EQ(utf8Length("你好"), 2u);
    EXPECT_EQ(splitUtf8("a你b").size(), 3u);
}

TEST(TextUtilsTest, DecodeAndEncodeCodepoints) {
    auto decoded = decodeUtf8("aé你😀");
    ASSERT_EQ(decoded.size(), 4u);
    EXPECT_EQ(decoded[0], U'a');
    EXPECT_EQ(decoded[1], U'é');
    EXPECT_EQ(decoded[2], U'你');
    EXPECT_EQ(decoded[3], U'\U0001F600');

    std::string encoded;
    for (char32_t cp : decoded) {
        encoded += encodeUtf8(cp);
    }
    EXPECT_EQ(encoded, "aé你😀");
}

TEST(TextUtilsTest, DecodeKeepsTruncatedBytes) {
    std::string truncated = "a\xe4\xbd";
    auto decoded = decodeUtf8(truncated);
    ASSERT_EQ(decoded.size(), 3u);
    EXPECT_EQ(decoded[1], static_cast<char32_t>(0xe4));
}

TEST(TextUtilsTest, WhitespaceHandling) {
    EXPECT_EQ(trim("  x y \n"), "x y");
    EXPECT_EQ(collapseWhitespace(" a \t\n b  "), "a b");
    EXPECT_TRUE(isBlank(" \t\xe3\x80\x80\n"));
    EXPECT_FALSE(isBlank(" . "));
}

TEST(TextUtilsTest, PunctuationClasses) {
    EXPECT_TRUE(isSentenceTerminator("."));
    EXPECT_TRUE(isSentenceTerminator("；"));
    EXPECT_FALSE(isSentenceTerminator(","));
    EXPECT_TRUE(isFullWidthTerminator("。"));
    EXPECT_FALSE(isFullWidthTerminator("."));
    EXPECT_TRUE(isClosingPunctuation("\""));
    EXPECT_TRUE(isClosingPunctuation("」"));
    EXPECT_FALSE(isClosingPunctuation("("));
}

}  // namespace
}  // namespace text
}  // namespace sonata
