#include <iostream>
#include <memory>
#include "errors.h"
#include "logger.h"
#include "server.h"
#include "simplified_chinese_recognizer.h"
#include "whisper_recognizer.h"

int main(int argc, char** argv) {
    ServerConfig config;
    try {
        if (!apply_command_line(argc, argv, config)) {
            std::cout << usage(argv[0]);
            return 0;
        }
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << usage(argv[0]);
        return 2;
    }

    LogLevel level = LogLevel::INFO;
    if (parse_log_level(config.log_level, level)) {
        Logger::instance().set_level(level);
    }

    try {
        ClassifierFactory classifier_factory = make_classifier_factory(config.vad);
        // 启动时构造一次, 模型缺失尽早失败
        classifier_factory();

        WhisperRecognizer whisper(config.recognizer.model, config.recognizer.threads);
        IRecognizer* base = &whisper;
        std::unique_ptr<SimplifiedChineseRecognizer> simplified;
        if (config.recognizer.t2s) {
            simplified = std::make_unique<SimplifiedChineseRecognizer>(whisper, config.recognizer.opencc_config);
            base = simplified.get();
        }
        LimitedRecognizer recognizer(*base, static_cast<size_t>(config.recognizer.max_concurrent));

        AudioServer server(config, recognizer, classifier_factory);
        server.run();
    } catch (const std::exception& e) {
        LOG_ERROR("Exception: " << e.what());
        return 1;
    }
    return 0;
}
