#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "frame_classifier.h"
#include "session_worker.h"
#include "test_helpers.h"

using json = nlohmann::json;

class SessionWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.language = "en";
        config.idle_flush_ms = 0;
    }

    std::unique_ptr<SessionWorker> make_worker() {
        return std::make_unique<SessionWorker>("user_1", config, recognizer, make_classifier_factory(VadConfig()),
                                               [this](const std::string& message) {
                                                   std::lock_guard<std::mutex> lock(mutex_);
                                                   messages_.push_back(json::parse(message));
                                                   cond_.notify_all();
                                               });
    }

    // 等待收到指定类型的消息
    bool wait_for_type(const std::string& type, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cond_.wait_for(lock, timeout, [&] {
            for (const auto& m : messages_) {
                if (m["type"] == type) {
                    return true;
                }
            }
            return false;
        });
    }

    std::vector<std::string> types() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& m : messages_) {
            out.push_back(m["type"].get<std::string>());
        }
        return out;
    }

    SessionConfig config;
    FakeRecognizer recognizer;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::vector<json> messages_;
};

TEST_F(SessionWorkerTest, ProcessesMessagesInArrivalOrder) {
    std::unique_ptr<SessionWorker> worker = make_worker();
    worker->start();

    worker->post_text(R"({"command":"start"})");
    std::vector<int16_t> tone = make_tone(3000);
    const size_t step = static_cast<size_t>(ms_to_samples(100));
    for (size_t i = 0; i < tone.size(); i += step) {
        worker->post_binary(to_pcm_bytes(std::vector<int16_t>(tone.begin() + i, tone.begin() + i + step)));
    }
    worker->post_text(R"({"command":"stop"})");

    ASSERT_TRUE(wait_for_type("session_ended"));
    std::vector<std::string> expected = {"connected", "session_started", "partial", "final", "session_ended"};
    EXPECT_EQ(types(), expected);

    worker->close();
    worker->join();
    EXPECT_TRUE(worker->finished());
}

TEST_F(SessionWorkerTest, NothingIsSentAfterClose) {
    std::unique_ptr<SessionWorker> worker = make_worker();
    worker->start();
    worker->post_text(R"({"command":"start"})");
    ASSERT_TRUE(wait_for_type("session_started"));

    worker->close();
    EXPECT_FALSE(worker->connected());
    worker->post_text(R"({"command":"ping"})");
    worker->join();

    EXPECT_TRUE(worker->finished());
    std::vector<std::string> expected = {"connected", "session_started"};
    EXPECT_EQ(types(), expected);
}

TEST_F(SessionWorkerTest, InputPauseSendsPartial) {
    config.idle_flush_ms = 100;
    std::unique_ptr<SessionWorker> worker = make_worker();
    worker->start();

    worker->post_text(R"({"command":"start"})");
    worker->post_binary(to_pcm_bytes(make_tone(1000)));

    ASSERT_TRUE(wait_for_type("partial"));
    worker->post_text(R"({"command":"stop"})");
    ASSERT_TRUE(wait_for_type("session_ended"));

    std::vector<std::string> expected = {"connected", "session_started", "partial", "final", "session_ended"};
    EXPECT_EQ(types(), expected);
    worker->close();
}

TEST_F(SessionWorkerTest, DestructorStopsThread) {
    {
        std::unique_ptr<SessionWorker> worker = make_worker();
        worker->start();
        ASSERT_TRUE(wait_for_type("connected"));
    }
    EXPECT_EQ(types().size(), 1u);
}
