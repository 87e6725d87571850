#include "frame_classifier.h"
#include <cmath>
#include "errors.h"
#include "silero_frame_classifier.h"

EnergyFrameClassifier::EnergyFrameClassifier(float energy_threshold, float max_zero_crossing_rate,
                                             int frame_ms, int sample_rate)
    : energy_threshold_(energy_threshold),
      max_zero_crossing_rate_(max_zero_crossing_rate),
      frame_samples_(static_cast<size_t>(frame_ms * (sample_rate / 1000))) {
    if (frame_samples_ == 0) {
        throw ConfigError("energy VAD frame must contain at least one sample");
    }
}

bool EnergyFrameClassifier::is_voiced(const int16_t* frame) {
    double sum_squares = 0.0;
    size_t crossings = 0;
    for (size_t i = 0; i < frame_samples_; ++i) {
        double x = frame[i] / 32768.0;
        sum_squares += x * x;
        if (i > 0 && ((frame[i - 1] < 0) != (frame[i] < 0))) {
            ++crossings;
        }
    }
    last_rms_ = static_cast<float>(std::sqrt(sum_squares / frame_samples_));
    last_zcr_ = frame_samples_ > 1 ? static_cast<float>(crossings) / (frame_samples_ - 1) : 0.0f;

    // 宽带噪声 (嘶声) 过零率很高, 不算语音
    return last_rms_ >= energy_threshold_ && last_zcr_ <= max_zero_crossing_rate_;
}

void EnergyFrameClassifier::reset() {
    last_rms_ = 0.0f;
    last_zcr_ = 0.0f;
}

ClassifierFactory make_classifier_factory(const VadConfig& config) {
    if (config.backend == "energy") {
        float threshold = config.energy_threshold;
        float max_zcr = config.max_zero_crossing_rate;
        return [threshold, max_zcr]() -> std::unique_ptr<IFrameClassifier> {
            return std::make_unique<EnergyFrameClassifier>(threshold, max_zcr);
        };
    }
    if (config.backend == "silero") {
        std::string model_path = config.silero_model;
        float threshold = config.silero_threshold;
        return [model_path, threshold]() -> std::unique_ptr<IFrameClassifier> {
            return std::make_unique<SileroFrameClassifier>(model_path, threshold);
        };
    }
    throw ConfigError("unknown vad backend '" + config.backend + "'");
}
