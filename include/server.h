#pragma once

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "recognizer.h"
#include "server_config.h"
#include "session_registry.h"
#include "session_worker.h"

// 定义服务器类型
typedef websocketpp::server<websocketpp::config::asio> server;
using websocketpp::connection_hdl;

class AudioServer {
public:
    AudioServer(const ServerConfig& config, IRecognizer& recognizer, ClassifierFactory classifier_factory);
    ~AudioServer();

    // 阻塞运行直到 stop() 或收到 SIGINT/SIGTERM
    void run();
    void stop();

private:
    // WebSocket 回调
    void on_open(connection_hdl hdl);
    void on_close(connection_hdl hdl);
    void on_message(connection_hdl hdl, server::message_ptr msg);

    void send(connection_hdl hdl, const std::string& payload);
    void retire(std::shared_ptr<SessionWorker> worker);
    void reap_finished();

private:
    server srv_;
    ServerConfig config_;
    IRecognizer& recognizer_;
    ClassifierFactory classifier_factory_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> id_counter_;

    // 会话管理
    typedef SessionRegistry<connection_hdl, SessionWorker, std::owner_less<connection_hdl>> WorkerRegistry;
    WorkerRegistry sessions_;

    // 已断开但工作线程可能还在完成识别的会话
    std::vector<std::shared_ptr<SessionWorker>> retired_;
    std::mutex retired_mutex_;
};
