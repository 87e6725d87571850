#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include "frame_classifier.h"

struct SilenceAnalysis {
    bool is_silence = true;              // 本次送入的音频中没有有声帧
    size_t trailing_silence_samples = 0; // 末尾连续静音长度
    size_t voiced_samples = 0;           // 上一个边界以来的有声音频长度
    bool boundary = false;               // 已有语音且末尾静音达到最小静音时长
};

// 增量式末尾静音检测.
// 新到的音频按整帧分类, 不足一帧的部分留到下次凑齐.
class SilenceDetector {
public:
    SilenceDetector(std::unique_ptr<IFrameClassifier> classifier, size_t min_silence_samples);

    SilenceAnalysis feed(const int16_t* samples, size_t count);
    SilenceAnalysis feed(const std::vector<int16_t>& samples) { return feed(samples.data(), samples.size()); }

    // 缓冲区提交之后调用, 之前的语音不再计入
    void mark_boundary();

    void reset();

    SilenceAnalysis current() const;
    bool has_voice() const { return voiced_samples_ > 0; }
    size_t trailing_silence_samples() const { return trailing_silence_; }
    size_t min_silence_samples() const { return min_silence_samples_; }
    size_t frame_samples() const { return classifier_->frame_samples(); }
    size_t pending_samples() const { return pending_.size(); }

private:
    void classify_frame(const int16_t* frame, bool& any_voiced);

    std::unique_ptr<IFrameClassifier> classifier_;
    size_t min_silence_samples_;
    std::vector<int16_t> pending_;
    size_t trailing_silence_ = 0;
    size_t voiced_samples_ = 0;
};
