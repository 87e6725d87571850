#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "frame_classifier.h"
#include "session.h"

struct RecognizerConfig {
    std::string model = "../model/ggml-medium.bin";
    int threads = 4;
    int max_concurrent = 2;
    bool t2s = true;                       // 中文结果繁体转简体
    std::string opencc_config = "t2s.json";
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8765;
    std::string log_level = "info";

    SessionConfig session;
    VadConfig vad;
    RecognizerConfig recognizer;

    // 范围检查, 不合法时抛出 ConfigError
    void validate() const;
};

// 读取 JSON 配置文件, 未出现的键保持默认值
ServerConfig load_config_file(const std::string& path);
void apply_config_json(const nlohmann::json& j, ServerConfig& config);

// 解析命令行. 返回 false 表示只需打印帮助 (--help)
bool apply_command_line(int argc, char** argv, ServerConfig& config);

std::string usage(const std::string& program);
