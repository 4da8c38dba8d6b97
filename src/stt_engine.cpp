#include "stt_engine.h"
#include "logger.h"
#include "utils.h"
#include "wav_io.h"
#include <whisper.h>
#include <chrono>
#include <mutex>
#include <vector>

namespace optidex {

namespace {

// Whisper emits these for silence or noise instead of an empty transcript
bool is_non_speech(const std::string& text) {
    std::string t = utils::normalize_copy(utils::trim_copy(text));
    return t.empty() || t == "[blank_audio]" || t == "[silence]" ||
           t == "(silence)" || t == "[music]" || t == "[noise]";
}

} // namespace

class STTEngine::Impl {
public:
    explicit Impl(const STTConfig& config) : config_(config) {
        if (config_.model_path.empty()) {
            LOG_STT("No model path specified");
            return;
        }

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        std::string model = utils::expand_path(config_.model_path);
        ctx_ = whisper_init_from_file_with_params(model.c_str(), cparams);
        if (!ctx_) {
            Logger::error("[STT] Failed to load whisper model: " + model);
            return;
        }
        LOG_STT("Model loaded: " + model);
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    std::optional<std::string> recognize(const std::string& audio_path) {
        auto wav = read_wav(audio_path);
        if (wav.is_error()) {
            Logger::error("[STT] " + wav.error().to_string());
            return std::nullopt;
        }

        const WavData& data = wav.value();
        AudioBuffer samples = data.sample_rate == audio::SAMPLE_RATE
            ? data.samples
            : resample(data.samples, data.sample_rate, audio::SAMPLE_RATE);

        std::string text = utils::trim_copy(transcribe(samples));
        if (is_non_speech(text)) {
            LOG_STT("No speech in " + audio_path);
            return std::nullopt;
        }
        return text;
    }

    std::string transcribe(const AudioBuffer& segment) {
        if (!ctx_ || segment.empty()) {
            return "";
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto start = std::chrono::steady_clock::now();

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.translate = false;
        params.language = config_.language.c_str();
        params.n_threads = config_.threads;
        params.no_context = true;

        std::vector<float> pcmf32(segment.size());
        for (size_t i = 0; i < segment.size(); i++) {
            pcmf32[i] = static_cast<float>(segment[i]) / 32768.0f;
        }

        int ret = whisper_full(ctx_, params, pcmf32.data(), static_cast<int>(pcmf32.size()));
        if (ret != 0) {
            Logger::error("[STT] whisper_full failed: " + std::to_string(ret));
            return "";
        }

        std::string text;
        int n_segments = whisper_full_n_segments(ctx_);
        for (int i = 0; i < n_segments; i++) {
            text += whisper_full_get_segment_text(ctx_, i);
        }

        LOG_STT("Transcribed " + std::to_string(segment.size() * 1000 / audio::SAMPLE_RATE) +
                " ms of audio in " + std::to_string(ms_since(start)) + " ms: \"" +
                utils::trim_copy(text) + "\"");
        return text;
    }

    bool is_ready() const {
        return ctx_ != nullptr;
    }

private:
    STTConfig config_;
    whisper_context* ctx_ = nullptr;
    std::mutex mutex_;
};

STTEngine::STTEngine(const STTConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

STTEngine::~STTEngine() = default;

std::optional<std::string> STTEngine::recognize(const std::string& audio_path) {
    return pimpl_->recognize(audio_path);
}

std::string STTEngine::transcribe(const AudioBuffer& segment) {
    return pimpl_->transcribe(segment);
}

bool STTEngine::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace optidex
