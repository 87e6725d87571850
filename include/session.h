#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "audio_format.h"
#include "audio_ring_buffer.h"
#include "frame_classifier.h"
#include "recognition_scheduler.h"
#include "recognizer.h"
#include "session_event.h"

enum class SessionState {
    IDLE,     // 已连接, 未 start
    ACTIVE,   // 接收音频, 调度器运行中
    DRAINING, // 收到 stop, 最终识别进行中
    CLOSED    // 终态, 不再产生任何消息
};

enum class ServerMode {
    STREAMING,
    SINGLE_SHOT
};

const char* to_string(SessionState state);
const char* to_string(ServerMode mode);
bool parse_server_mode(const std::string& name, ServerMode& mode);

struct SessionConfig {
    ServerMode mode = ServerMode::STREAMING;
    std::string language = "zh";
    AudioEncoding encoding = AudioEncoding::PCM_S16LE;
    SchedulerConfig scheduler;
    int buffer_capacity_ms = 60000;
    int idle_flush_ms = 1000; // 0 关闭
};

// 单个连接的会话状态机.
// 所有方法都在该连接自己的工作线程上调用, 不加锁.
class Session {
public:
    typedef std::function<void(const SessionEvent&)> EventSink;

    Session(std::string id, const SessionConfig& config, IRecognizer& recognizer,
            ClassifierFactory classifier_factory, EventSink sink);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // 连接建立, 发送 connected
    void open();

    // 文本帧 (JSON 控制命令) 与二进制帧 (音频). 协议/格式错误转成 error 消息, 不抛出
    void handle_text(const std::string& payload);
    void handle_binary(const std::string& payload);

    // 以下命令在状态不允许时抛出 ProtocolError
    void start(const std::string& language, AudioEncoding encoding);
    void stop();
    void ping();

    // 一段时间没有收到消息: 若上次识别之后有新的语音, 补发一次 partial (不提交)
    void on_idle();

    // 连接断开: 直接进入 CLOSED, 不再发送任何消息
    void close();

    SessionState state() const { return state_; }
    const std::string& id() const { return id_; }
    const std::string& language() const { return language_; }
    const std::string& committed_transcript() const { return committed_; }
    uint64_t sequence() const { return seq_; }
    size_t buffered_samples() const { return buffer_ ? buffer_->unconsumed_samples() : 0; }
    const AudioRingBuffer* buffer() const { return buffer_.get(); }
    const RecognitionScheduler* scheduler() const { return scheduler_.get(); }

private:
    void dispatch_command(const std::string& payload);
    void process_audio(const std::string& raw_data);
    void process_single_shot(const std::string& raw_data);
    void execute_pass(SchedulerDecision decision, bool forced);
    void emit(const SessionEvent& event);
    void emit_error(ErrorCode code, const std::string& message);
    void set_state(SessionState state);
    void release();

private:
    std::string id_;
    SessionConfig config_;
    IRecognizer& recognizer_;
    ClassifierFactory classifier_factory_;
    EventSink sink_;

    SessionState state_ = SessionState::IDLE;
    std::string language_;
    AudioEncoding encoding_;

    std::unique_ptr<AudioRingBuffer> buffer_;
    std::unique_ptr<RecognitionScheduler> scheduler_;

    // 已定稿的文本, 只追加不修改
    std::string committed_;
    uint64_t seq_ = 0;
    bool overflow_reported_ = false;
};
