#include "session_event.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

const char* to_string(EventType type) {
    switch (type) {
    case EventType::CONNECTED:
        return "connected";
    case EventType::SESSION_STARTED:
        return "session_started";
    case EventType::PARTIAL:
        return "partial";
    case EventType::FINAL:
        return "final";
    case EventType::ERROR:
        return "error";
    case EventType::SESSION_ENDED:
        return "session_ended";
    case EventType::PONG:
        return "pong";
    case EventType::PROCESSING:
        return "processing";
    case EventType::RESULT:
        return "result";
    }
    return "unknown";
}

const char* to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::NONE:
        return "none";
    case ErrorCode::FORMAT_ERROR:
        return "format_error";
    case ErrorCode::RECOGNIZER_ERROR:
        return "recognizer_error";
    case ErrorCode::BUFFER_OVERFLOW:
        return "overflow";
    case ErrorCode::PROTOCOL_ERROR:
        return "protocol_error";
    }
    return "unknown";
}

SessionEvent SessionEvent::make(EventType type) {
    SessionEvent event;
    event.type = type;
    return event;
}

SessionEvent SessionEvent::error(ErrorCode code, const std::string& message) {
    SessionEvent event;
    event.type = EventType::ERROR;
    event.code = code;
    event.message = message;
    return event;
}

std::string SessionEvent::to_json() const {
    json j = {{"type", to_string(type)}};

    switch (type) {
    case EventType::CONNECTED:
        j["message"] = message;
        j["mode"] = mode;
        break;
    case EventType::SESSION_STARTED:
        j["language"] = language;
        j["format"] = format;
        break;
    case EventType::PARTIAL:
    case EventType::FINAL: {
        j["text"] = text;
        j["is_final"] = type == EventType::FINAL;
        j["seq"] = seq;
        j["transcript"] = transcript;
        json segs = json::array();
        for (const auto& s : segments) {
            json seg = {{"start_ms", s.start_ms}, {"end_ms", s.end_ms}, {"text", s.text}};
            if (s.confidence >= 0.0f) {
                seg["confidence"] = s.confidence;
            }
            segs.push_back(seg);
        }
        j["segments"] = segs;
        break;
    }
    case EventType::ERROR:
        j["message"] = message;
        j["code"] = to_string(code);
        break;
    case EventType::PROCESSING:
        j["message"] = message;
        break;
    case EventType::RESULT:
        j["text"] = text;
        break;
    case EventType::SESSION_ENDED:
    case EventType::PONG:
        break;
    }
    return j.dump();
}
