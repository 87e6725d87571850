#include "audio_ring_buffer.h"
#include <algorithm>
#include "errors.h"

AudioRingBuffer::AudioRingBuffer(size_t capacity_samples, int sample_rate, int channels)
    : capacity_(capacity_samples), sample_rate_(sample_rate), channels_(channels) {
    if (capacity_ == 0) {
        throw ConfigError("audio buffer capacity must be positive");
    }
}

AppendResult AudioRingBuffer::append(const AudioChunk& chunk) {
    check_format(chunk, sample_rate_, channels_);

    samples_.insert(samples_.end(), chunk.samples.begin(), chunk.samples.end());

    AppendResult result;
    if (samples_.size() > capacity_) {
        // drop-oldest
        size_t excess = samples_.size() - capacity_;
        samples_.erase(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(excess));
        begin_ += static_cast<int64_t>(excess);
        dropped_total_ += excess;
        result.overflow = true;
        result.dropped_samples = excess;
    }
    return result;
}

RecognitionWindow AudioRingBuffer::snapshot_window(size_t max_samples) const {
    size_t count = std::min(max_samples, samples_.size());
    return snapshot_range(end_position() - static_cast<int64_t>(count), end_position());
}

RecognitionWindow AudioRingBuffer::snapshot_range(int64_t begin, int64_t end) const {
    RecognitionWindow window;
    window.sample_rate = sample_rate_;
    begin = std::max(begin, begin_);
    end = std::min(end, end_position());
    if (end <= begin) {
        window.begin = window.end = std::max(begin_, std::min(begin, end_position()));
        return window;
    }

    window.begin = begin;
    window.end = end;
    window.samples.reserve(static_cast<size_t>(end - begin));
    auto first = samples_.begin() + static_cast<std::ptrdiff_t>(begin - begin_);
    auto last = samples_.begin() + static_cast<std::ptrdiff_t>(end - begin_);
    for (auto it = first; it != last; ++it) {
        window.samples.push_back(*it / 32768.0f);
    }
    return window;
}

void AudioRingBuffer::commit(int64_t position) {
    if (position <= begin_) {
        return;
    }
    int64_t upto = std::min(position, end_position());
    samples_.erase(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(upto - begin_));
    begin_ = upto;
}

void AudioRingBuffer::clear() {
    begin_ = end_position();
    std::deque<int16_t>().swap(samples_);
}
