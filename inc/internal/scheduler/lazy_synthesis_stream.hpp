#ifndef SONATA_LAZY_SYNTHESIS_STREAM_HPP
#define SONATA_LAZY_SYNTHESIS_STREAM_HPP

#include "internal/scheduler/synthesis_stream.hpp"
#include "internal/text/text_segmenter.hpp"

namespace sonata {

// =============================================================================
// LazySynthesisStream (惰性模式)
// =============================================================================
//
// 在调用方线程上运行: 每次 next() 合成且只合成一个分段。
// 两次 next() 之间不做任何工作, 首块延迟最低。
//

class LazySynthesisStream : public SynthesisStreamBase {
public:
    explicit LazySynthesisStream(SynthesisJob job);

    bool next(WaveSamples& chunk) override;
    void cancel() override;

private:
    text::SegmentSequence segments_;
};

}  // namespace sonata

#endif  // SONATA_LAZY_SYNTHESIS_STREAM_HPP
