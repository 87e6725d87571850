#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "audio_format.h"

// 逐帧的有声/无声判定.
// 实现可以是有状态的 (例如 RNN 模型), 因此每个会话持有独立实例, 且帧必须按时间顺序送入.
class IFrameClassifier {
public:
    virtual ~IFrameClassifier() = default;

    // 每帧的采样数
    virtual size_t frame_samples() const = 0;

    // frame 指向 frame_samples() 个采样
    virtual bool is_voiced(const int16_t* frame) = 0;

    virtual void reset() = 0;
};

// 短时能量 + 过零率
class EnergyFrameClassifier : public IFrameClassifier {
public:
    explicit EnergyFrameClassifier(float energy_threshold = 0.01f, float max_zero_crossing_rate = 0.5f,
                                   int frame_ms = 20, int sample_rate = kSampleRate);

    size_t frame_samples() const override { return frame_samples_; }
    bool is_voiced(const int16_t* frame) override;
    void reset() override;

    float last_rms() const { return last_rms_; }
    float last_zero_crossing_rate() const { return last_zcr_; }

private:
    float energy_threshold_;
    float max_zero_crossing_rate_;
    size_t frame_samples_;
    float last_rms_ = 0.0f;
    float last_zcr_ = 0.0f;
};

struct VadConfig {
    std::string backend = "energy"; // energy | silero
    float energy_threshold = 0.01f;
    float max_zero_crossing_rate = 0.5f;
    std::string silero_model = "../model/silero_vad.onnx";
    float silero_threshold = 0.5f;
};

typedef std::function<std::unique_ptr<IFrameClassifier>()> ClassifierFactory;

// 按配置构造分类器工厂; backend 未知时抛出 ConfigError
ClassifierFactory make_classifier_factory(const VadConfig& config);
