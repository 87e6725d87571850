#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "audio_ring_buffer.h"
#include "recognizer.h"
#include "silence_detector.h"

enum class SchedulerDecision {
    NoAction,
    TriggerPartial,
    TriggerFinal
};

const char* to_string(SchedulerDecision decision);

struct SchedulerConfig {
    int trigger_interval_ms = 3000; // 新增多少音频触发一次中间识别
    int max_window_ms = 30000;      // 单次送入识别器的窗口上限
    int min_silence_ms = 300;       // 末尾静音达到该时长视为句子边界
    int min_recognition_ms = 320;   // 短于该时长的音频不送识别器
};

// 一次识别的结果
struct PassOutcome {
    SchedulerDecision decision = SchedulerDecision::NoAction;
    bool ok = true;
    bool recognized = false; // 是否实际调用了识别器
    bool committed = false;  // final 成功后音频已提交
    std::string text;
    std::vector<RecognizedSegment> segments; // 时间为会话流内的绝对毫秒
    std::string error;
    int64_t window_begin = 0;
    int64_t window_end = 0;
};

// 决定每次追加音频后是否识别, 并执行识别.
// partial 识别不提交缓冲区, 后续 partial 会重新识别重叠的音频;
// final 识别覆盖全部未提交音频, 成功后提交.
class RecognitionScheduler {
public:
    RecognitionScheduler(const SchedulerConfig& config, SilenceDetector detector);

    // 每次 append 之后调用, chunk 为刚追加的音频
    SchedulerDecision on_audio_appended(const AudioRingBuffer& buffer, const AudioChunk& chunk);

    // 显式 stop 等同于一个人为边界, 不检查静音时长
    SchedulerDecision force_final() const;

    // 输入停顿: 上次触发之后有新的语音时做一次不提交的识别
    SchedulerDecision on_idle(const AudioRingBuffer& buffer) const;

    PassOutcome run_pass(SchedulerDecision decision, AudioRingBuffer& buffer, IRecognizer& recognizer,
                         const std::string& language);

    // 自上个边界以来没有语音时, 该位置之前的前导静音可以丢弃
    int64_t retirable_position(const AudioRingBuffer& buffer) const;

    bool in_flight() const { return in_flight_; }
    bool has_pending_voice() const { return detector_.has_voice(); }
    bool retry_blocked() const { return retry_blocked_; }
    int64_t last_trigger_position() const { return last_trigger_pos_; }
    const SilenceAnalysis& last_analysis() const { return last_analysis_; }
    const SchedulerConfig& config() const { return config_; }

private:
    void recognize(const RecognitionWindow& window, IRecognizer& recognizer, const std::string& language,
                   PassOutcome& outcome);

    SchedulerConfig config_;
    size_t trigger_interval_samples_;
    size_t max_window_samples_;
    size_t min_recognition_samples_;

    SilenceDetector detector_;
    SilenceAnalysis last_analysis_;
    int64_t last_trigger_pos_ = 0;
    bool in_flight_ = false;
    // final 失败后, 静音边界不再立即重试, 直到出现新的语音或又积累了一个触发间隔
    bool retry_blocked_ = false;
};
