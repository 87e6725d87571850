#pragma once
#include <cmath>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "audio_format.h"
#include "errors.h"
#include "recognizer.h"
#include "session.h"
#include "session_event.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

// 440Hz 正弦波, 能量 VAD 判为语音
inline std::vector<int16_t> make_tone(int ms, double amplitude = 0.3, double freq = 440.0) {
    size_t n = static_cast<size_t>(ms_to_samples(ms));
    std::vector<int16_t> samples(n);
    for (size_t i = 0; i < n; ++i) {
        samples[i] = static_cast<int16_t>(amplitude * 32767.0 * std::sin(2.0 * M_PI * freq * i / kSampleRate));
    }
    return samples;
}

inline std::vector<int16_t> make_silence(int ms) {
    return std::vector<int16_t>(static_cast<size_t>(ms_to_samples(ms)), 0);
}

inline AudioChunk make_chunk(const std::vector<int16_t>& samples) {
    AudioChunk chunk;
    chunk.samples = samples;
    return chunk;
}

inline std::string to_pcm_bytes(const std::vector<int16_t>& samples) {
    std::string bytes;
    bytes.reserve(samples.size() * 2);
    for (int16_t s : samples) {
        uint16_t u = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<char>(u & 0xFF));
        bytes.push_back(static_cast<char>((u >> 8) & 0xFF));
    }
    return bytes;
}

inline std::string make_wav(const std::vector<int16_t>& samples, uint32_t sample_rate = kSampleRate,
                            uint16_t channels = 1, uint16_t bits = 16) {
    std::string pcm = to_pcm_bytes(samples);
    auto u32 = [](uint32_t v) {
        std::string s(4, '\0');
        for (int i = 0; i < 4; ++i) s[i] = static_cast<char>((v >> (8 * i)) & 0xFF);
        return s;
    };
    auto u16 = [](uint16_t v) {
        std::string s(2, '\0');
        s[0] = static_cast<char>(v & 0xFF);
        s[1] = static_cast<char>((v >> 8) & 0xFF);
        return s;
    };
    uint16_t block_align = static_cast<uint16_t>(channels * bits / 8);
    std::string fmt = u16(1) + u16(channels) + u32(sample_rate) + u32(sample_rate * block_align) +
                      u16(block_align) + u16(bits);
    std::string body = "WAVE" + std::string("fmt ") + u32(16) + fmt + "data" +
                       u32(static_cast<uint32_t>(pcm.size())) + pcm;
    return "RIFF" + u32(static_cast<uint32_t>(body.size())) + body;
}

// 返回 "<prefix><调用序号>", 可以指定接下来若干次调用失败
class FakeRecognizer : public IRecognizer {
public:
    explicit FakeRecognizer(std::string prefix = "w") : prefix_(std::move(prefix)) {}

    RecognitionResult transcribe(const RecognitionWindow& window, const std::string& language) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        windows_.push_back(std::make_pair(window.begin, window.end));
        languages_.push_back(language);
        if (failures_ > 0) {
            --failures_;
            throw RecognizerError("decoder failed");
        }
        RecognitionResult result;
        result.text = fixed_text_.empty() ? prefix_ + std::to_string(calls_) : fixed_text_;
        RecognizedSegment segment;
        segment.start_ms = 0;
        segment.end_ms = window.duration_ms();
        segment.text = result.text;
        segment.confidence = 0.9f;
        result.segments.push_back(segment);
        return result;
    }

    void fail_next(int n) { failures_ = n; }
    void set_text(const std::string& text) { fixed_text_ = text; }

    int calls() const { return calls_; }
    const std::vector<std::pair<int64_t, int64_t>>& windows() const { return windows_; }
    const std::vector<std::string>& languages() const { return languages_; }

private:
    std::string prefix_;
    std::string fixed_text_;
    int failures_ = 0;
    int calls_ = 0;
    std::vector<std::pair<int64_t, int64_t>> windows_;
    std::vector<std::string> languages_;
    std::mutex mutex_;
};

struct EventLog {
    std::vector<SessionEvent> events;

    Session::EventSink sink() {
        return [this](const SessionEvent& event) { events.push_back(event); };
    }

    size_t count(EventType type) const {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.type == type) ++n;
        }
        return n;
    }

    std::vector<SessionEvent> of(EventType type) const {
        std::vector<SessionEvent> out;
        for (const auto& e : events) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

    std::vector<EventType> types() const {
        std::vector<EventType> out;
        for (const auto& e : events) out.push_back(e.type);
        return out;
    }
};
