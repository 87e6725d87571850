#include "session.h"
#include <nlohmann/json.hpp>
#include "errors.h"
#include "logger.h"
#include "text_utils.h"

using json = nlohmann::json;

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::IDLE:
        return "idle";
    case SessionState::ACTIVE:
        return "active";
    case SessionState::DRAINING:
        return "draining";
    case SessionState::CLOSED:
        return "closed";
    }
    return "unknown";
}

const char* to_string(ServerMode mode) {
    return mode == ServerMode::SINGLE_SHOT ? "single_shot" : "streaming";
}

bool parse_server_mode(const std::string& name, ServerMode& mode) {
    if (name == "streaming") {
        mode = ServerMode::STREAMING;
    } else if (name == "single_shot" || name == "single-shot") {
        mode = ServerMode::SINGLE_SHOT;
    } else {
        return false;
    }
    return true;
}

// ==========================================
// Session 实现
// ==========================================

Session::Session(std::string id, const SessionConfig& config, IRecognizer& recognizer,
                 ClassifierFactory classifier_factory, EventSink sink)
    : id_(std::move(id)),
      config_(config),
      recognizer_(recognizer),
      classifier_factory_(std::move(classifier_factory)),
      sink_(std::move(sink)),
      language_(config.language),
      encoding_(config.encoding) {
    LOG_INFO("[Session " << id_ << "] Created (" << to_string(config_.mode) << ")");
}

Session::~Session() {
    LOG_INFO("[Session " << id_ << "] Destroyed");
}

void Session::open() {
    SessionEvent event = SessionEvent::make(EventType::CONNECTED);
    event.mode = to_string(config_.mode);
    event.message = config_.mode == ServerMode::STREAMING ? "Connected to streaming STT service"
                                                          : "Connected to STT service";
    emit(event);
}

void Session::handle_text(const std::string& payload) {
    if (state_ == SessionState::CLOSED) {
        LOG_DEBUG("[Session " << id_ << "] Ignoring message after close");
        return;
    }
    try {
        dispatch_command(payload);
    } catch (const ProtocolError& e) {
        LOG_WARN("[Session " << id_ << "] Protocol error: " << e.what());
        emit_error(ErrorCode::PROTOCOL_ERROR, e.what());
    }
}

void Session::handle_binary(const std::string& payload) {
    if (state_ == SessionState::CLOSED) {
        return;
    }
    if (config_.mode == ServerMode::SINGLE_SHOT) {
        process_single_shot(payload);
        return;
    }
    try {
        process_audio(payload);
    } catch (const ProtocolError& e) {
        LOG_WARN("[Session " << id_ << "] Protocol error: " << e.what());
        emit_error(ErrorCode::PROTOCOL_ERROR, e.what());
    } catch (const FormatError& e) {
        LOG_WARN("[Session " << id_ << "] Rejected audio chunk: " << e.what());
        emit_error(ErrorCode::FORMAT_ERROR, e.what());
    }
}

void Session::dispatch_command(const std::string& payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object() || !j.contains("command") || !j["command"].is_string()) {
        throw ProtocolError("message has no \"command\" field");
    }

    const std::string cmd = j["command"].get<std::string>();
    if (cmd == "start") {
        std::string language = language_;
        AudioEncoding encoding = config_.encoding;
        if (j.contains("language")) {
            if (!j["language"].is_string() || j["language"].get<std::string>().empty()) {
                throw ProtocolError("\"language\" must be a non-empty string");
            }
            language = j["language"].get<std::string>();
        }
        if (j.contains("format")) {
            if (!j["format"].is_string() || !parse_audio_encoding(j["format"].get<std::string>(), encoding)) {
                throw ProtocolError("unsupported audio format " + j["format"].dump());
            }
        }
        start(language, encoding);
    } else if (cmd == "stop") {
        stop();
    } else if (cmd == "ping") {
        ping();
    } else {
        throw ProtocolError("unknown command '" + cmd + "'");
    }
}

void Session::start(const std::string& language, AudioEncoding encoding) {
    if (config_.mode == ServerMode::SINGLE_SHOT) {
        throw ProtocolError("start is not supported in single_shot mode");
    }
    if (state_ != SessionState::IDLE) {
        throw ProtocolError(std::string("start received while ") + to_string(state_));
    }

    language_ = language;
    encoding_ = encoding;
    committed_.clear();
    seq_ = 0;
    overflow_reported_ = false;

    buffer_ = std::make_unique<AudioRingBuffer>(
        static_cast<size_t>(ms_to_samples(config_.buffer_capacity_ms)));
    SilenceDetector detector(classifier_factory_(),
                             static_cast<size_t>(ms_to_samples(config_.scheduler.min_silence_ms)));
    scheduler_ = std::make_unique<RecognitionScheduler>(config_.scheduler, std::move(detector));

    set_state(SessionState::ACTIVE);

    SessionEvent event = SessionEvent::make(EventType::SESSION_STARTED);
    event.language = language_;
    event.format = to_string(encoding_);
    emit(event);
}

void Session::stop() {
    if (config_.mode == ServerMode::SINGLE_SHOT) {
        throw ProtocolError("stop is not supported in single_shot mode");
    }
    if (state_ != SessionState::ACTIVE) {
        throw ProtocolError(std::string("stop received while ") + to_string(state_));
    }

    set_state(SessionState::DRAINING);
    execute_pass(scheduler_->force_final(), true);

    emit(SessionEvent::make(EventType::SESSION_ENDED));
    set_state(SessionState::CLOSED);
    release();
    LOG_INFO("[Session " << id_ << "] Ended, transcript: " << committed_);
}

void Session::ping() {
    if (state_ == SessionState::CLOSED) {
        return;
    }
    emit(SessionEvent::make(EventType::PONG));
}

void Session::on_idle() {
    if (state_ != SessionState::ACTIVE) {
        return;
    }
    SchedulerDecision decision = scheduler_->on_idle(*buffer_);
    if (decision == SchedulerDecision::NoAction) {
        return;
    }
    LOG_DEBUG("[Session " << id_ << "] Input paused at " << scheduler_->last_trigger_position() << " -> "
              << buffer_->end_position() << ", refreshing partial");
    execute_pass(decision, false);
}

void Session::close() {
    if (state_ == SessionState::CLOSED) {
        return;
    }
    // 断线不保证 final
    set_state(SessionState::CLOSED);
    release();
}

void Session::process_audio(const std::string& raw_data) {
    if (state_ == SessionState::IDLE) {
        throw ProtocolError("audio received before start");
    }
    if (state_ != SessionState::ACTIVE) {
        return;
    }

    AudioChunk chunk = decode_audio(raw_data, encoding_);
    if (chunk.samples.empty()) {
        return;
    }

    AppendResult appended = buffer_->append(chunk);
    if (appended.overflow) {
        int64_t dropped_ms = samples_to_ms(static_cast<int64_t>(appended.dropped_samples));
        // 每次溢出只提示一次, 缓冲区腾出空间 (有音频被提交) 后重新计
        if (!overflow_reported_) {
            LOG_WARN("[Session " << id_ << "] Buffer overflow, dropped " << dropped_ms << " ms");
            emit_error(ErrorCode::BUFFER_OVERFLOW,
                       "audio buffer full, dropped " + std::to_string(dropped_ms) + " ms of oldest audio");
            overflow_reported_ = true;
        } else {
            LOG_DEBUG("[Session " << id_ << "] Buffer still full, dropped " << dropped_ms << " ms");
        }
    } else {
        overflow_reported_ = false;
    }

    SchedulerDecision decision = scheduler_->on_audio_appended(*buffer_, chunk);
    if (decision != SchedulerDecision::NoAction) {
        LOG_DEBUG("[Session " << id_ << "] " << to_string(decision) << " at " << buffer_->end_position());
        execute_pass(decision, false);
        return;
    }

    int64_t retire = scheduler_->retirable_position(*buffer_);
    if (retire > buffer_->begin_position()) {
        buffer_->commit(retire);
    }
}

void Session::execute_pass(SchedulerDecision decision, bool forced) {
    PassOutcome outcome = scheduler_->run_pass(decision, *buffer_, recognizer_, language_);

    if (!outcome.ok) {
        LOG_ERROR("[Session " << id_ << "] " << to_string(decision) << " failed: " << outcome.error);
        emit_error(ErrorCode::RECOGNIZER_ERROR, "transcription failed: " + outcome.error);
        // stop 仍然要以 final 结束
        if (!forced) {
            return;
        }
    }

    SessionEvent event;
    event.text = outcome.text;
    event.segments = outcome.segments;

    if (decision == SchedulerDecision::TriggerPartial) {
        if (outcome.text.empty()) {
            return;
        }
        event.type = EventType::PARTIAL;
        event.transcript = committed_;
        append_text(event.transcript, outcome.text, language_);
    } else {
        // 空文本的边界不单独发 final, stop 除外
        if (outcome.text.empty() && !forced) {
            LOG_DEBUG("[Session " << id_ << "] Boundary without text, nothing to emit");
            return;
        }
        append_text(committed_, outcome.text, language_);
        event.type = EventType::FINAL;
        event.transcript = committed_;
        LOG_INFO("[Session " << id_ << "] Final: " << outcome.text);
    }

    event.seq = ++seq_;
    emit(event);
}

void Session::process_single_shot(const std::string& raw_data) {
    SessionEvent processing = SessionEvent::make(EventType::PROCESSING);
    processing.message = "Transcribing...";
    emit(processing);

    try {
        AudioChunk chunk = decode_audio(raw_data, config_.encoding);
        check_format(chunk, kSampleRate, kChannels);
        if (chunk.samples.empty()) {
            throw FormatError("empty audio payload");
        }

        RecognitionWindow window;
        window.samples = to_float(chunk.samples.data(), chunk.samples.size());
        window.begin = 0;
        window.end = static_cast<int64_t>(chunk.samples.size());

        RecognitionResult result = recognizer_.transcribe(window, language_);
        SessionEvent event = SessionEvent::make(EventType::RESULT);
        event.text = trim(result.text);
        LOG_INFO("[Session " << id_ << "] Result: " << event.text);
        emit(event);
    } catch (const FormatError& e) {
        LOG_WARN("[Session " << id_ << "] Rejected audio: " << e.what());
        emit_error(ErrorCode::FORMAT_ERROR, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("[Session " << id_ << "] Transcription failed: " << e.what());
        emit_error(ErrorCode::RECOGNIZER_ERROR, std::string("transcription failed: ") + e.what());
    }
}

void Session::emit(const SessionEvent& event) {
    if (state_ == SessionState::CLOSED) {
        return;
    }
    if (sink_) {
        sink_(event);
    }
}

void Session::emit_error(ErrorCode code, const std::string& message) {
    emit(SessionEvent::error(code, message));
}

void Session::set_state(SessionState state) {
    if (state_ == state) {
        return;
    }
    LOG_DEBUG("[Session " << id_ << "] State " << to_string(state_) << " -> " << to_string(state));
    state_ = state;
}

void Session::release() {
    scheduler_.reset();
    buffer_.reset();
}
