#pragma once
#include <string>
#include "recognizer.h"

struct whisper_context;

// whisper.cpp 识别器. 模型只加载一次, 每次识别使用独立的 whisper_state, 可并发调用.
class WhisperRecognizer : public IRecognizer {
public:
    explicit WhisperRecognizer(const std::string& model_path, int threads = 4);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    RecognitionResult transcribe(const RecognitionWindow& window, const std::string& language) override;

private:
    whisper_context* context_ = nullptr;
    int threads_;
};
