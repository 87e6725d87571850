#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "audio_ring_buffer.h"

struct RecognizedSegment {
    int64_t start_ms = 0; // 相对窗口起点
    int64_t end_ms = 0;
    std::string text;
    float confidence = -1.0f; // < 0 表示未知
};

struct RecognitionResult {
    std::string text;
    std::vector<RecognizedSegment> segments;
};

// 外部语音识别器. 同一窗口重复识别应得到相同文本.
// 失败时抛出 RecognizerError.
class IRecognizer {
public:
    virtual ~IRecognizer() = default;
    virtual RecognitionResult transcribe(const RecognitionWindow& window, const std::string& language) = 0;
};

// 限制跨会话的并发识别数量, 超出的调用排队等待
class LimitedRecognizer : public IRecognizer {
public:
    LimitedRecognizer(IRecognizer& inner, size_t max_concurrent);

    RecognitionResult transcribe(const RecognitionWindow& window, const std::string& language) override;

    size_t active() const;
    size_t max_concurrent() const { return max_concurrent_; }

private:
    void acquire();
    void release();

    IRecognizer& inner_;
    const size_t max_concurrent_;
    size_t active_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
};
