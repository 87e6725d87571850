#include "recognition_scheduler.h"
#include <algorithm>
#include <exception>
#include "errors.h"
#include "logger.h"
#include "text_utils.h"

const char* to_string(SchedulerDecision decision) {
    switch (decision) {
    case SchedulerDecision::NoAction:
        return "NoAction";
    case SchedulerDecision::TriggerPartial:
        return "TriggerPartial";
    case SchedulerDecision::TriggerFinal:
        return "TriggerFinal";
    }
    return "Unknown";
}

RecognitionScheduler::RecognitionScheduler(const SchedulerConfig& config, SilenceDetector detector)
    : config_(config),
      trigger_interval_samples_(static_cast<size_t>(ms_to_samples(config.trigger_interval_ms))),
      max_window_samples_(static_cast<size_t>(ms_to_samples(config.max_window_ms))),
      min_recognition_samples_(static_cast<size_t>(ms_to_samples(config.min_recognition_ms))),
      detector_(std::move(detector)) {
    if (trigger_interval_samples_ == 0 || max_window_samples_ == 0) {
        throw ConfigError("trigger interval and max window must be positive");
    }
}

SchedulerDecision RecognitionScheduler::on_audio_appended(const AudioRingBuffer& buffer, const AudioChunk& chunk) {
    last_analysis_ = detector_.feed(chunk.samples);

    // 同一会话同时只允许一次识别
    if (in_flight_) {
        return SchedulerDecision::NoAction;
    }

    if (!last_analysis_.is_silence) {
        retry_blocked_ = false;
    }

    int64_t since = std::max(last_trigger_pos_, buffer.begin_position());
    size_t accumulated = static_cast<size_t>(std::max<int64_t>(0, buffer.end_position() - since));

    if (last_analysis_.boundary && buffer.unconsumed_samples() > 0) {
        if (retry_blocked_ && accumulated < trigger_interval_samples_) {
            return SchedulerDecision::NoAction;
        }
        return SchedulerDecision::TriggerFinal;
    }
    if (accumulated >= trigger_interval_samples_) {
        if (!detector_.has_voice()) {
            // 纯静音不识别
            return SchedulerDecision::NoAction;
        }
        return SchedulerDecision::TriggerPartial;
    }
    return SchedulerDecision::NoAction;
}

SchedulerDecision RecognitionScheduler::force_final() const {
    return SchedulerDecision::TriggerFinal;
}

SchedulerDecision RecognitionScheduler::on_idle(const AudioRingBuffer& buffer) const {
    if (in_flight_ || !detector_.has_voice() || buffer.end_position() <= last_trigger_pos_) {
        return SchedulerDecision::NoAction;
    }
    return SchedulerDecision::TriggerPartial;
}

PassOutcome RecognitionScheduler::run_pass(SchedulerDecision decision, AudioRingBuffer& buffer,
                                           IRecognizer& recognizer, const std::string& language) {
    PassOutcome outcome;
    outcome.decision = decision;
    if (decision == SchedulerDecision::NoAction) {
        return outcome;
    }

    in_flight_ = true;
    last_trigger_pos_ = buffer.end_position();
    const int64_t boundary = buffer.end_position();
    const bool voiced = detector_.has_voice();

    if (decision == SchedulerDecision::TriggerPartial) {
        RecognitionWindow window = buffer.snapshot_window(max_window_samples_);
        outcome.window_begin = window.begin;
        outcome.window_end = window.end;
        if (voiced && window.samples.size() >= min_recognition_samples_) {
            recognize(window, recognizer, language, outcome);
        }
        in_flight_ = false;
        return outcome;
    }

    // final: 边界之前的全部未提交音频, 按窗口上限分段识别
    outcome.window_begin = buffer.begin_position();
    outcome.window_end = boundary;
    if (voiced && static_cast<size_t>(boundary - buffer.begin_position()) >= min_recognition_samples_) {
        for (int64_t pos = buffer.begin_position(); pos < boundary && outcome.ok;
             pos += static_cast<int64_t>(max_window_samples_)) {
            int64_t end = std::min(boundary, pos + static_cast<int64_t>(max_window_samples_));
            recognize(buffer.snapshot_range(pos, end), recognizer, language, outcome);
        }
    }

    if (outcome.ok) {
        buffer.commit(boundary);
        detector_.mark_boundary();
        outcome.committed = true;
        retry_blocked_ = false;
    } else {
        retry_blocked_ = true;
        // 失败时保留音频, 下次触发时连同新音频一起重试
        outcome.text.clear();
        outcome.segments.clear();
    }
    in_flight_ = false;
    return outcome;
}

void RecognitionScheduler::recognize(const RecognitionWindow& window, IRecognizer& recognizer,
                                     const std::string& language, PassOutcome& outcome) {
    LOG_DEBUG("Recognizing " << window.duration_ms() << " ms [" << window.begin << ", " << window.end << ")");
    try {
        RecognitionResult result = recognizer.transcribe(window, language);
        outcome.recognized = true;
        append_text(outcome.text, result.text, language);

        const int64_t offset_ms = samples_to_ms(window.begin, window.sample_rate);
        for (const auto& segment : result.segments) {
            RecognizedSegment absolute = segment;
            absolute.start_ms += offset_ms;
            absolute.end_ms += offset_ms;
            outcome.segments.push_back(absolute);
        }
    } catch (const std::exception& e) {
        outcome.ok = false;
        outcome.error = e.what();
    }
}

int64_t RecognitionScheduler::retirable_position(const AudioRingBuffer& buffer) const {
    if (detector_.has_voice() || in_flight_) {
        return buffer.begin_position();
    }
    // 保留最近一段静音 (至少一帧) 作为下一句的前导上下文
    int64_t keep = static_cast<int64_t>(std::max(detector_.min_silence_samples(), detector_.frame_samples()));
    return std::max(buffer.begin_position(), buffer.end_position() - keep);
}
