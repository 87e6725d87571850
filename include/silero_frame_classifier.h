#pragma once
#include <memory>
#include <string>
#include <vector>
#include "frame_classifier.h"
#include "onnxruntime_cxx_api.h"

// Silero VAD (v5 ONNX) 帧分类器.
// 每帧 32ms (16k 下 512 个采样), 前面拼接上一帧末尾的 64 个采样作为上下文.
// 概率 >= threshold 判为语音, < threshold - 0.15 判为静音, 中间区域保持上一帧的判定.
class SileroFrameClassifier : public IFrameClassifier {
public:
    explicit SileroFrameClassifier(const std::string& model_path, float threshold = 0.5f,
                                   int sample_rate = kSampleRate, int window_frame_ms = 32);

    size_t frame_samples() const override { return static_cast<size_t>(window_size_samples_); }
    bool is_voiced(const int16_t* frame) override;
    void reset() override;

    // 输入一帧 float PCM, 返回语音概率
    float predict(const std::vector<float>& data_chunk);
    float last_probability() const { return last_prob_; }

private:
    void init_onnx_model(const std::string& model_path);
    void init_engine_threads(int inter_threads, int intra_threads);

private:
    // ONNX Runtime resources
    Ort::Env env_;
    Ort::SessionOptions session_options_;
    std::shared_ptr<Ort::Session> session_;
    Ort::MemoryInfo memory_info_ = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeCPU);

    const int context_samples_ = 64;
    std::vector<float> context_;
    int window_size_samples_;
    int effective_window_size_;

    std::vector<const char*> input_node_names_ = {"input", "state", "sr"};
    std::vector<const char*> output_node_names_ = {"output", "stateN"};
    std::vector<float> input_;
    const size_t size_state_ = 2 * 1 * 128;
    std::vector<float> state_;
    std::vector<int64_t> sr_;
    int64_t input_node_dims_[2] = {};
    const int64_t state_node_dims_[3] = {2, 1, 128};
    const int64_t sr_node_dims_[1] = {1};

    float threshold_;
    float last_prob_ = 0.0f;
    bool voiced_ = false;
};
