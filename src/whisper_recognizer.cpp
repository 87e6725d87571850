#include "whisper_recognizer.h"
#include <whisper.h>
#include <memory>
#include "errors.h"
#include "logger.h"
#include "text_utils.h"

namespace {

struct StateDeleter {
    void operator()(whisper_state* state) const { whisper_free_state(state); }
};

} // namespace

WhisperRecognizer::WhisperRecognizer(const std::string& model_path, int threads) : threads_(threads) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;

    context_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!context_) {
        throw ConfigError("whisper_init_from_file_with_params failed: " + model_path);
    }
    LOG_INFO("Whisper model loaded: " << model_path);
}

WhisperRecognizer::~WhisperRecognizer() {
    if (context_) whisper_free(context_);
}

RecognitionResult WhisperRecognizer::transcribe(const RecognitionWindow& window, const std::string& language) {
    RecognitionResult result;
    if (window.empty()) return result;

    std::unique_ptr<whisper_state, StateDeleter> state(whisper_init_state(context_));
    if (!state) throw RecognizerError("whisper_init_state failed");

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = threads_;
    params.language = language.c_str();
    params.translate = false;
    params.no_context = true;
    params.single_segment = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;

    params.no_speech_thold = 0.6f;

    const int rc = whisper_full_with_state(context_, state.get(), params, window.samples.data(),
                                           static_cast<int>(window.samples.size()));
    if (rc != 0) throw RecognizerError("whisper_full failed with code " + std::to_string(rc));

    const int n_segments = whisper_full_n_segments_from_state(state.get());
    for (int i = 0; i < n_segments; ++i) {
        RecognizedSegment segment;
        segment.text = trim(whisper_full_get_segment_text_from_state(state.get(), i));
        // whisper 的时间单位是 10ms
        segment.start_ms = whisper_full_get_segment_t0_from_state(state.get(), i) * 10;
        segment.end_ms = whisper_full_get_segment_t1_from_state(state.get(), i) * 10;

        const int n_tokens = whisper_full_n_tokens_from_state(state.get(), i);
        if (n_tokens > 0) {
            float sum = 0.0f;
            for (int t = 0; t < n_tokens; ++t) {
                sum += whisper_full_get_token_p_from_state(state.get(), i, t);
            }
            segment.confidence = sum / n_tokens;
        }

        append_text(result.text, segment.text, language);
        result.segments.push_back(segment);
    }
    return result;
}
