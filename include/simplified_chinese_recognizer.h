#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "recognizer.h"

namespace opencc {
class SimpleConverter;
}

// 识别结果繁体转简体 (OpenCC). 只处理中文会话, 其他语言原样返回.
class SimplifiedChineseRecognizer : public IRecognizer {
public:
    // opencc_config 为 OpenCC 配置文件名或路径; 加载失败抛出 ConfigError
    explicit SimplifiedChineseRecognizer(IRecognizer& inner, const std::string& opencc_config = "t2s.json");
    ~SimplifiedChineseRecognizer() override;

    RecognitionResult transcribe(const RecognitionWindow& window, const std::string& language) override;

    std::string convert(const std::string& text) const;

private:
    IRecognizer& inner_;
    std::unique_ptr<opencc::SimpleConverter> converter_;
    mutable std::mutex mutex_;
};
