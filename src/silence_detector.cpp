#include "silence_detector.h"
#include "errors.h"

SilenceDetector::SilenceDetector(std::unique_ptr<IFrameClassifier> classifier, size_t min_silence_samples)
    : classifier_(std::move(classifier)), min_silence_samples_(min_silence_samples) {
    if (!classifier_) {
        throw ConfigError("silence detector requires a frame classifier");
    }
    pending_.reserve(classifier_->frame_samples());
}

SilenceAnalysis SilenceDetector::feed(const int16_t* samples, size_t count) {
    const size_t frame = classifier_->frame_samples();
    bool any_voiced = false;
    size_t i = 0;

    // 先补齐上次剩下的半帧
    if (!pending_.empty()) {
        size_t need = frame - pending_.size();
        size_t take = need < count ? need : count;
        pending_.insert(pending_.end(), samples, samples + take);
        i = take;
        if (pending_.size() == frame) {
            classify_frame(pending_.data(), any_voiced);
            pending_.clear();
        }
    }

    for (; i + frame <= count; i += frame) {
        classify_frame(samples + i, any_voiced);
    }

    if (i < count) {
        pending_.insert(pending_.end(), samples + i, samples + count);
    }

    SilenceAnalysis analysis = current();
    analysis.is_silence = !any_voiced;
    return analysis;
}

void SilenceDetector::classify_frame(const int16_t* frame, bool& any_voiced) {
    if (classifier_->is_voiced(frame)) {
        any_voiced = true;
        voiced_samples_ += classifier_->frame_samples();
        trailing_silence_ = 0;
    } else {
        trailing_silence_ += classifier_->frame_samples();
    }
}

void SilenceDetector::mark_boundary() {
    voiced_samples_ = 0;
    trailing_silence_ = 0;
}

void SilenceDetector::reset() {
    classifier_->reset();
    pending_.clear();
    voiced_samples_ = 0;
    trailing_silence_ = 0;
}

SilenceAnalysis SilenceDetector::current() const {
    SilenceAnalysis analysis;
    analysis.is_silence = voiced_samples_ == 0;
    analysis.trailing_silence_samples = trailing_silence_;
    analysis.voiced_samples = voiced_samples_;
    analysis.boundary = voiced_samples_ > 0 && trailing_silence_ >= min_silence_samples_;
    return analysis;
}
