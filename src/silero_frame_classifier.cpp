#include "silero_frame_classifier.h"
#include <algorithm>
#include <cstring>
#include <fstream>
#include "errors.h"
#include "logger.h"

SileroFrameClassifier::SileroFrameClassifier(const std::string& model_path, float threshold,
                                             int sample_rate, int window_frame_ms)
    : env_(ORT_LOGGING_LEVEL_WARNING, "silero_vad"), threshold_(threshold) {
    if (sample_rate != 16000 && sample_rate != 8000) {
        throw ConfigError("silero VAD supports 8000 or 16000 Hz, got " + std::to_string(sample_rate));
    }
    window_size_samples_ = window_frame_ms * (sample_rate / 1000);
    effective_window_size_ = window_size_samples_ + context_samples_;
    input_node_dims_[0] = 1;
    input_node_dims_[1] = effective_window_size_;
    state_.assign(size_state_, 0.0f);
    sr_.assign(1, sample_rate);
    context_.assign(context_samples_, 0.0f);
    input_.assign(effective_window_size_, 0.0f);

    init_onnx_model(model_path);
}

void SileroFrameClassifier::init_onnx_model(const std::string& model_path) {
    if (!std::ifstream(model_path).good()) {
        throw ConfigError("silero VAD model not found: " + model_path);
    }
    init_engine_threads(1, 1);
    try {
        session_ = std::make_shared<Ort::Session>(env_, model_path.c_str(), session_options_);
    } catch (const Ort::Exception& e) {
        throw ConfigError("failed to load silero VAD model " + model_path + ": " + e.what());
    }
    LOG_DEBUG("[SileroVad] Loaded " << model_path);
}

void SileroFrameClassifier::init_engine_threads(int inter_threads, int intra_threads) {
    session_options_.SetIntraOpNumThreads(intra_threads);
    session_options_.SetInterOpNumThreads(inter_threads);
    session_options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
}

void SileroFrameClassifier::reset() {
    std::fill(state_.begin(), state_.end(), 0.0f);
    std::fill(context_.begin(), context_.end(), 0.0f);
    last_prob_ = 0.0f;
    voiced_ = false;
}

float SileroFrameClassifier::predict(const std::vector<float>& data_chunk) {
    std::fill(input_.begin(), input_.end(), 0.0f);
    std::copy(context_.begin(), context_.end(), input_.begin());
    size_t n = std::min(data_chunk.size(), static_cast<size_t>(window_size_samples_));
    std::copy(data_chunk.begin(), data_chunk.begin() + n, input_.begin() + context_samples_);

    std::vector<Ort::Value> ort_inputs;
    ort_inputs.emplace_back(Ort::Value::CreateTensor<float>(
        memory_info_, input_.data(), input_.size(), input_node_dims_, 2));
    ort_inputs.emplace_back(Ort::Value::CreateTensor<float>(
        memory_info_, state_.data(), state_.size(), state_node_dims_, 3));
    ort_inputs.emplace_back(Ort::Value::CreateTensor<int64_t>(
        memory_info_, sr_.data(), sr_.size(), sr_node_dims_, 1));

    std::vector<Ort::Value> ort_outputs;
    try {
        ort_outputs = session_->Run(
            Ort::RunOptions{nullptr},
            input_node_names_.data(), ort_inputs.data(), ort_inputs.size(),
            output_node_names_.data(), output_node_names_.size());
    } catch (const Ort::Exception& e) {
        throw SttError(std::string("silero VAD inference failed: ") + e.what());
    }

    last_prob_ = ort_outputs[0].GetTensorMutableData<float>()[0];
    const float* state_n = ort_outputs[1].GetTensorMutableData<float>();
    std::memcpy(state_.data(), state_n, size_state_ * sizeof(float));

    // 本帧末尾作为下一帧的上下文
    std::copy(input_.end() - context_samples_, input_.end(), context_.begin());
    return last_prob_;
}

bool SileroFrameClassifier::is_voiced(const int16_t* frame) {
    float prob = predict(to_float(frame, static_cast<size_t>(window_size_samples_)));
    if (prob >= threshold_) {
        voiced_ = true;
    } else if (prob < threshold_ - 0.15f) {
        voiced_ = false;
    }
    return voiced_;
}
