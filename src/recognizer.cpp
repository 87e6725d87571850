#include "recognizer.h"
#include "errors.h"

LimitedRecognizer::LimitedRecognizer(IRecognizer& inner, size_t max_concurrent)
    : inner_(inner), max_concurrent_(max_concurrent) {
    if (max_concurrent_ == 0) {
        throw ConfigError("max concurrent recognitions must be positive");
    }
}

RecognitionResult LimitedRecognizer::transcribe(const RecognitionWindow& window, const std::string& language) {
    struct Slot {
        explicit Slot(LimitedRecognizer& owner) : owner_(owner) { owner_.acquire(); }
        ~Slot() { owner_.release(); }
        LimitedRecognizer& owner_;
    } slot(*this);

    return inner_.transcribe(window, language);
}

size_t LimitedRecognizer::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void LimitedRecognizer::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return active_ < max_concurrent_; });
    ++active_;
}

void LimitedRecognizer::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
    }
    cond_.notify_one();
}
