#include "session_worker.h"
#include <chrono>
#include <exception>
#include "logger.h"

SessionWorker::SessionWorker(const std::string& id, const SessionConfig& config, IRecognizer& recognizer,
                             ClassifierFactory classifier_factory, Sender sender)
    : id_(id), sender_(std::move(sender)), idle_flush_ms_(config.idle_flush_ms) {
    session_ = std::make_unique<Session>(id, config, recognizer, std::move(classifier_factory),
                                         [this](const SessionEvent& event) {
                                             if (!connected_) {
                                                 return;
                                             }
                                             sender_(event.to_json());
                                         });
    post(SessionTask::Kind::OPEN, std::string());
}

SessionWorker::~SessionWorker() {
    close();
    join();
}

void SessionWorker::start() {
    thread_ = std::thread(&SessionWorker::run, this);
}

void SessionWorker::post_text(std::string payload) {
    post(SessionTask::Kind::TEXT, std::move(payload));
}

void SessionWorker::post_binary(std::string payload) {
    post(SessionTask::Kind::BINARY, std::move(payload));
}

void SessionWorker::close() {
    if (connected_.exchange(false)) {
        post(SessionTask::Kind::CLOSE, std::string());
    }
}

void SessionWorker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SessionWorker::post(SessionTask::Kind kind, std::string payload) {
    SessionTask task;
    task.kind = kind;
    task.payload = std::move(payload);
    queue_.push(std::move(task));
}

void SessionWorker::run() {
    LOG_DEBUG("[Session " << id_ << "] Worker thread started");
    while (true) {
        SessionTask task;
        if (idle_flush_ms_ > 0) {
            if (!queue_.pop_for(task, std::chrono::milliseconds(idle_flush_ms_))) {
                session_->on_idle();
                continue;
            }
        } else {
            task = queue_.pop();
        }

        if (task.kind == SessionTask::Kind::CLOSE) {
            session_->close();
            break;
        }
        process(task);
    }
    finished_ = true;
    LOG_DEBUG("[Session " << id_ << "] Worker thread finished");
}

void SessionWorker::process(const SessionTask& task) {
    try {
        switch (task.kind) {
        case SessionTask::Kind::OPEN:
            session_->open();
            break;
        case SessionTask::Kind::TEXT:
            session_->handle_text(task.payload);
            break;
        case SessionTask::Kind::BINARY:
            session_->handle_binary(task.payload);
            break;
        case SessionTask::Kind::CLOSE:
            break;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Session " << id_ << "] Task failed: " << e.what());
    }
}
