#include "simplified_chinese_recognizer.h"
#include <opencc/opencc.h>
#include <exception>
#include "errors.h"
#include "logger.h"

namespace {

bool is_chinese(const std::string& language) {
    return language == "zh" || language == "yue";
}

} // namespace

SimplifiedChineseRecognizer::SimplifiedChineseRecognizer(IRecognizer& inner, const std::string& opencc_config)
    : inner_(inner) {
    try {
        converter_ = std::make_unique<opencc::SimpleConverter>(opencc_config);
    } catch (const std::exception& e) {
        throw ConfigError("failed to load OpenCC config " + opencc_config + ": " + e.what());
    }
    LOG_INFO("OpenCC converter loaded: " << opencc_config);
}

SimplifiedChineseRecognizer::~SimplifiedChineseRecognizer() = default;

RecognitionResult SimplifiedChineseRecognizer::transcribe(const RecognitionWindow& window,
                                                          const std::string& language) {
    RecognitionResult result = inner_.transcribe(window, language);
    if (!is_chinese(language)) {
        return result;
    }

    result.text = convert(result.text);
    for (auto& segment : result.segments) {
        segment.text = convert(segment.text);
    }
    return result;
}

std::string SimplifiedChineseRecognizer::convert(const std::string& text) const {
    if (text.empty()) {
        return text;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return converter_->Convert(text);
    } catch (const std::exception& e) {
        throw RecognizerError(std::string("OpenCC conversion failed: ") + e.what());
    }
}
