#pragma once
#include <stdexcept>
#include <string>

// 服务内部异常基类
class SttError : public std::runtime_error {
public:
    explicit SttError(const std::string& what) : std::runtime_error(what) {}
};

// 音频块编码与会话声明格式不符
class FormatError : public SttError {
public:
    explicit FormatError(const std::string& what) : SttError(what) {}
};

// 外部识别器在一次识别中失败
class RecognizerError : public SttError {
public:
    explicit RecognizerError(const std::string& what) : SttError(what) {}
};

// 未知命令或控制消息顺序错误
class ProtocolError : public SttError {
public:
    explicit ProtocolError(const std::string& what) : SttError(what) {}
};

// 启动期配置错误 (致命)
class ConfigError : public SttError {
public:
    explicit ConfigError(const std::string& what) : SttError(what) {}
};
