#include "server.h"
#include <csignal>
#include <functional>
#include "logger.h"

AudioServer::AudioServer(const ServerConfig& config, IRecognizer& recognizer, ClassifierFactory classifier_factory)
    : config_(config),
      recognizer_(recognizer),
      classifier_factory_(std::move(classifier_factory)),
      running_(false),
      id_counter_(0) {
    // 1. 关闭多余日志
    srv_.clear_access_channels(websocketpp::log::alevel::all);
    srv_.set_error_channels(websocketpp::log::elevel::all);

    // 2. 初始化 Asio
    srv_.init_asio();
    srv_.set_reuse_addr(true);

    // 3. 注册回调
    srv_.set_open_handler(std::bind(&AudioServer::on_open, this, std::placeholders::_1));
    srv_.set_close_handler(std::bind(&AudioServer::on_close, this, std::placeholders::_1));
    srv_.set_fail_handler(std::bind(&AudioServer::on_close, this, std::placeholders::_1));
    srv_.set_message_handler(std::bind(&AudioServer::on_message, this, std::placeholders::_1, std::placeholders::_2));
}

AudioServer::~AudioServer() {
    stop();
}

void AudioServer::run() {
    running_ = true;

    websocketpp::lib::asio::signal_set signals(srv_.get_io_service(), SIGINT, SIGTERM);
    signals.async_wait([this](const websocketpp::lib::asio::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_INFO("Received signal " << signal_number << ", shutting down");
            stop();
        }
    });

    // 启动监听
    srv_.listen(config_.host, std::to_string(config_.port));
    srv_.start_accept();

    LOG_INFO("Server listening on ws://" << config_.host << ":" << config_.port
             << " (" << to_string(config_.session.mode) << ")");

    // 阻塞运行
    srv_.run();
}

void AudioServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    websocketpp::lib::error_code ec;
    srv_.stop_listening(ec);
    srv_.stop();

    for (auto& worker : sessions_.clear()) {
        retire(worker);
    }
    std::lock_guard<std::mutex> lock(retired_mutex_);
    for (auto& worker : retired_) {
        worker->join();
    }
    retired_.clear();
    LOG_INFO("Server stopped");
}

void AudioServer::on_open(connection_hdl hdl) {
    std::string uid = "user_" + std::to_string(++id_counter_);
    auto worker = sessions_.create(hdl, uid, config_.session, recognizer_, classifier_factory_,
                                   [this, hdl](const std::string& payload) { send(hdl, payload); });
    if (!worker) {
        LOG_WARN("Duplicate open for connection, ignoring");
        return;
    }
    worker->start();
    LOG_INFO("[Session " << uid << "] Connected, " << sessions_.size() << " active");
    reap_finished();
}

void AudioServer::on_close(connection_hdl hdl) {
    auto worker = sessions_.remove(hdl);
    if (!worker) {
        return;
    }
    LOG_INFO("[Session " << worker->id() << "] Disconnected");
    retire(worker);
    reap_finished();
}

void AudioServer::on_message(connection_hdl hdl, server::message_ptr msg) {
    auto worker = sessions_.lookup(hdl);
    if (!worker) {
        return;
    }

    if (msg->get_opcode() == websocketpp::frame::opcode::text) {
        worker->post_text(msg->get_payload());
    } else if (msg->get_opcode() == websocketpp::frame::opcode::binary) {
        worker->post_binary(msg->get_payload());
    }
}

void AudioServer::send(connection_hdl hdl, const std::string& payload) {
    try {
        srv_.send(hdl, payload, websocketpp::frame::opcode::text);
        LOG_DEBUG("-> Sent: " << payload);
    } catch (websocketpp::exception const& e) {
        LOG_WARN("Send failed: " << e.what());
    }
}

void AudioServer::retire(std::shared_ptr<SessionWorker> worker) {
    worker->close();
    std::lock_guard<std::mutex> lock(retired_mutex_);
    retired_.push_back(std::move(worker));
}

void AudioServer::reap_finished() {
    std::lock_guard<std::mutex> lock(retired_mutex_);
    for (auto it = retired_.begin(); it != retired_.end();) {
        if ((*it)->finished()) {
            (*it)->join();
            it = retired_.erase(it);
        } else {
            ++it;
        }
    }
}
