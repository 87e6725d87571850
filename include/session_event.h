#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "recognizer.h"

enum class EventType {
    CONNECTED,
    SESSION_STARTED,
    PARTIAL,
    FINAL,
    ERROR,
    SESSION_ENDED,
    PONG,
    PROCESSING, // single-shot
    RESULT      // single-shot
};

enum class ErrorCode {
    NONE,
    FORMAT_ERROR,
    RECOGNIZER_ERROR,
    BUFFER_OVERFLOW,
    PROTOCOL_ERROR
};

const char* to_string(EventType type);
const char* to_string(ErrorCode code);

// 服务端发往客户端的一条消息
struct SessionEvent {
    EventType type = EventType::PONG;
    std::string text;
    std::string message;
    std::string mode;
    std::string transcript;
    std::string language;
    std::string format;
    uint64_t seq = 0;
    ErrorCode code = ErrorCode::NONE;
    std::vector<RecognizedSegment> segments;

    bool is_transcript() const { return type == EventType::PARTIAL || type == EventType::FINAL; }

    // JSON 文本, 带 "type" 字段
    std::string to_json() const;

    static SessionEvent make(EventType type);
    static SessionEvent error(ErrorCode code, const std::string& message);
};
