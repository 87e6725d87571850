#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include "safe_queue.h"
#include "session.h"

// 工作线程任务包
struct SessionTask {
    enum class Kind {
        OPEN,
        TEXT,
        BINARY,
        CLOSE
    };

    Kind kind = Kind::CLOSE;
    std::string payload;
};

// 每个连接一个逻辑工作者: 任务队列 + 线程, 按到达顺序驱动 Session.
// 网络线程只入队, 识别期间到达的音频在队列中等待, 不会触发并发识别.
class SessionWorker {
public:
    typedef std::function<void(const std::string&)> Sender;

    SessionWorker(const std::string& id, const SessionConfig& config, IRecognizer& recognizer,
                  ClassifierFactory classifier_factory, Sender sender);
    ~SessionWorker();

    SessionWorker(const SessionWorker&) = delete;
    SessionWorker& operator=(const SessionWorker&) = delete;

    void start();

    void post_text(std::string payload);
    void post_binary(std::string payload);

    // 连接断开: 立即停止发送, 队列处理完后线程退出
    void close();

    void join();

    bool finished() const { return finished_; }
    bool connected() const { return connected_; }
    const std::string& id() const { return id_; }

private:
    void post(SessionTask::Kind kind, std::string payload);
    void run();
    void process(const SessionTask& task);

private:
    std::string id_;
    Sender sender_;
    int idle_flush_ms_;

    std::atomic<bool> connected_{true};
    std::atomic<bool> finished_{false};

    std::unique_ptr<Session> session_;
    SafeQueue<SessionTask> queue_;
    std::thread thread_;
};
