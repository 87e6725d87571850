#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "errors.h"
#include "recognizer.h"
#include "test_helpers.h"

namespace {

class SlowRecognizer : public IRecognizer {
public:
    RecognitionResult transcribe(const RecognitionWindow&, const std::string&) override {
        int now = ++active_;
        int seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --active_;
        if (fail_) {
            throw RecognizerError("model crashed");
        }
        RecognitionResult result;
        result.text = "ok";
        return result;
    }

    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
    bool fail_ = false;
};

} // namespace

TEST(LimitedRecognizerTest, CapsConcurrentCalls) {
    SlowRecognizer inner;
    LimitedRecognizer limited(inner, 2);
    RecognitionWindow window;

    std::atomic<int> done{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&] {
            if (limited.transcribe(window, "en").text == "ok") {
                ++done;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(done.load(), 6);
    EXPECT_LE(inner.peak_.load(), 2);
    EXPECT_EQ(limited.active(), 0u);
}

TEST(LimitedRecognizerTest, SlotIsReleasedOnFailure) {
    SlowRecognizer inner;
    inner.fail_ = true;
    LimitedRecognizer limited(inner, 1);
    RecognitionWindow window;

    EXPECT_THROW(limited.transcribe(window, "en"), RecognizerError);
    EXPECT_EQ(limited.active(), 0u);
    EXPECT_THROW(limited.transcribe(window, "en"), RecognizerError);
}

TEST(LimitedRecognizerTest, ZeroLimitIsRejected) {
    FakeRecognizer inner;
    EXPECT_THROW(LimitedRecognizer(inner, 0), ConfigError);
}
