#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>
#include "audio_format.h"

// 触发识别时拍下的音频快照, 交给识别器后只读
struct RecognitionWindow {
    std::vector<float> samples;
    int64_t begin = 0; // 会话流中的绝对采样位置
    int64_t end = 0;
    int sample_rate = kSampleRate;

    bool empty() const { return samples.empty(); }
    int64_t duration_ms() const { return samples_to_ms(end - begin, sample_rate); }
};

struct AppendResult {
    bool overflow = false;
    size_t dropped_samples = 0;
};

// 单个会话的 PCM 累积缓冲区.
// 位置均为会话开始以来的绝对采样下标: [begin_position, end_position) 为尚未提交的音频.
// 超出容量时丢弃最旧的音频并在返回值中报告 overflow.
class AudioRingBuffer {
public:
    explicit AudioRingBuffer(size_t capacity_samples, int sample_rate = kSampleRate, int channels = kChannels);

    // 格式不符时抛出 FormatError, 缓冲区不变
    AppendResult append(const AudioChunk& chunk);

    // 最近的至多 max_samples 个采样, 不移除
    RecognitionWindow snapshot_window(size_t max_samples) const;

    // [begin, end) 与缓冲区的交集
    RecognitionWindow snapshot_range(int64_t begin, int64_t end) const;

    // 提交 (退役) position 之前的音频, 之后不会再被读取
    void commit(int64_t position);

    void clear();

    int64_t begin_position() const { return begin_; }
    int64_t end_position() const { return begin_ + static_cast<int64_t>(samples_.size()); }
    size_t unconsumed_samples() const { return samples_.size(); }
    size_t capacity() const { return capacity_; }
    size_t dropped_total() const { return dropped_total_; }
    int sample_rate() const { return sample_rate_; }

private:
    std::deque<int16_t> samples_;
    size_t capacity_;
    int sample_rate_;
    int channels_;
    int64_t begin_ = 0;
    size_t dropped_total_ = 0;
};
