#include "audio_io.h"
#include "logger.h"
#include "utils.h"
#include "wav_io.h"
#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <thread>

namespace optidex {

class AudioIO::Impl {
public:
    Impl() = default;

    ~Impl() {
        stop();
    }

    bool start(const AudioConfig& config) {
        config_ = config;
        sample_rate_ = config.sample_rate;
        max_capture_samples_ = static_cast<size_t>(config.max_capture_ms) * sample_rate_ / 1000;

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        initialized_ = true;

        int input_idx = find_device(config.input_device, true);
        if (input_idx < 0) {
            Logger::error("Input device not found: " + config.input_device);
            stop();
            return false;
        }
        int output_idx = find_device(config.output_device, false);
        if (output_idx < 0) {
            Logger::error("Output device not found: " + config.output_device);
            stop();
            return false;
        }

        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        const PaDeviceInfo* output_info = Pa_GetDeviceInfo(output_idx);
        Logger::info("Using input device: [" + std::to_string(input_idx) + "] " + input_info->name);
        Logger::info("Using output device: [" + std::to_string(output_idx) + "] " + output_info->name);

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&input_stream_, &input_params, nullptr, sample_rate_,
                            frames_per_buffer(), paClipOff, input_callback, this);
        if (err != paNoError) {
            Logger::error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = 1;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = output_info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&output_stream_, nullptr, &output_params, sample_rate_,
                            frames_per_buffer(), paClipOff, output_callback, this);
        if (err != paNoError) {
            Logger::error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        err = Pa_StartStream(input_stream_);
        if (err != paNoError) {
            Logger::error("Failed to start input stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }
        err = Pa_StartStream(output_stream_);
        if (err != paNoError) {
            Logger::error("Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        std::error_code ec;
        std::filesystem::create_directories(utils::expand_path(config.recordings_dir), ec);
        if (ec) {
            Logger::warn("Cannot create recordings dir " + config.recordings_dir + ": " + ec.message());
        }

        LOG_AUDIO("Streams started at " + std::to_string(sample_rate_) + " Hz");
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(capture_mutex_);
            stop_requested_ = true;
        }
        capture_cv_.notify_all();
        if (capture_thread_.joinable()) capture_thread_.join();

        for (PaStream** stream : {&input_stream_, &output_stream_}) {
            if (*stream) {
                Pa_StopStream(*stream);
                Pa_CloseStream(*stream);
                *stream = nullptr;
            }
        }
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

    // =========================================================================
    // Capture
    // =========================================================================

    VoidResult start_capture(const std::string& path, Handler on_complete) {
        if (!input_stream_) {
            return make_error(ErrorType::InvalidState, "Audio input is not running");
        }
        {
            std::lock_guard<std::mutex> lock(capture_mutex_);
            if (capturing_) {
                return make_error(ErrorType::InvalidState, "Capture already in progress");
            }
        }
        // A previous capture that hit the length limit finished on its own
        if (capture_thread_.joinable()) capture_thread_.join();

        {
            std::lock_guard<std::mutex> lock(capture_mutex_);
            captured_.clear();
            captured_.reserve(max_capture_samples_);
            capture_path_ = path;
            on_complete_ = std::move(on_complete);
            stop_requested_ = false;
            capturing_ = true;
        }
        capture_thread_ = std::thread([this]() { finalize_when_done(); });
        LOG_AUDIO("Capture started: " + path);
        return VoidResult();
    }

    VoidResult stop_capture() {
        {
            std::lock_guard<std::mutex> lock(capture_mutex_);
            stop_requested_ = true;
        }
        capture_cv_.notify_all();
        if (capture_thread_.joinable()) capture_thread_.join();
        return last_capture_result_;
    }

    // =========================================================================
    // Playback
    // =========================================================================

    bool play(const AudioBuffer& buffer) {
        if (!output_stream_) return false;
        std::lock_guard<std::mutex> lock(playback_mutex_);
        playback_queue_.insert(playback_queue_.end(), buffer.begin(), buffer.end());
        return true;
    }

    bool is_playback_complete() const {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        return playback_queue_.empty();
    }

    void stop_playback() {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        playback_queue_.clear();
    }

    int sample_rate() const {
        return sample_rate_;
    }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }

        int num_devices = Pa_GetDeviceCount();
        Logger::info("Available audio devices:");

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name;
            if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
            if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
            Logger::info(oss.str());
        }

        Pa_Terminate();
    }

private:
    unsigned long frames_per_buffer() const {
        return static_cast<unsigned long>(sample_rate_ * audio::FRAME_DURATION_MS / 1000);
    }

    void finalize_when_done() {
        std::string path;
        AudioBuffer samples;
        Handler on_complete;
        {
            std::unique_lock<std::mutex> lock(capture_mutex_);
            capture_cv_.wait(lock, [this] {
                return stop_requested_ || captured_.size() >= max_capture_samples_;
            });
            if (!stop_requested_) {
                LOG_AUDIO("Capture reached length limit");
            }
            capturing_ = false;
            samples = std::move(captured_);
            captured_.clear();
            path = capture_path_;
            on_complete = std::move(on_complete_);
            on_complete_ = nullptr;
        }

        last_capture_result_ = write_wav(path, samples, sample_rate_);
        if (last_capture_result_.is_error()) {
            Logger::error("[Audio] " + last_capture_result_.error().to_string());
        } else {
            LOG_AUDIO("Capture saved: " + path + " (" +
                      std::to_string(samples.size() * 1000 / std::max(sample_rate_, 1)) + " ms)");
        }

        if (on_complete) on_complete();
    }

    int find_device(const std::string& name, bool is_input) {
        int num_devices = Pa_GetDeviceCount();

        if (name == "default" || name.empty()) {
            int idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
            return idx == paNoDevice ? -1 : idx;
        }

        // Numeric device index
        bool numeric = !name.empty() && name.find_first_not_of("0123456789") == std::string::npos;
        if (numeric) {
            int idx = std::stoi(name);
            return (idx >= 0 && idx < num_devices) ? idx : -1;
        }

        // Exact name, then substring (same physical device can appear with suffixes)
        for (int pass = 0; pass < 2; ++pass) {
            for (int i = 0; i < num_devices; i++) {
                const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
                if (!info) continue;
                int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
                if (channels == 0) continue;
                std::string device_name = info->name;
                bool match = pass == 0 ? device_name == name
                                       : utils::normalize_copy(device_name).find(utils::normalize_copy(name)) != std::string::npos;
                if (match) return i;
            }
        }
        return -1;
    }

    static int input_callback(const void* input, void*,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo*,
                              PaStreamCallbackFlags,
                              void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        if (!input) return paContinue;

        const Sample* in = static_cast<const Sample*>(input);
        bool full = false;
        {
            std::lock_guard<std::mutex> lock(self->capture_mutex_);
            if (!self->capturing_) return paContinue;
            size_t room = self->max_capture_samples_ - std::min(self->captured_.size(), self->max_capture_samples_);
            size_t n = std::min<size_t>(frame_count, room);
            self->captured_.insert(self->captured_.end(), in, in + n);
            full = self->captured_.size() >= self->max_capture_samples_;
        }
        if (full) self->capture_cv_.notify_all();
        return paContinue;
    }

    static int output_callback(const void*, void* output,
                               unsigned long frame_count,
                               const PaStreamCallbackTimeInfo*,
                               PaStreamCallbackFlags,
                               void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        Sample* out = static_cast<Sample*>(output);

        std::lock_guard<std::mutex> lock(self->playback_mutex_);
        size_t n = std::min<size_t>(frame_count, self->playback_queue_.size());
        std::copy(self->playback_queue_.begin(), self->playback_queue_.begin() + n, out);
        self->playback_queue_.erase(self->playback_queue_.begin(), self->playback_queue_.begin() + n);
        if (n < frame_count) {
            std::memset(out + n, 0, (frame_count - n) * sizeof(Sample));
        }
        return paContinue;
    }

    AudioConfig config_;
    PaStream* input_stream_ = nullptr;
    PaStream* output_stream_ = nullptr;
    bool initialized_ = false;
    int sample_rate_ = audio::SAMPLE_RATE;

    // Capture
    std::mutex capture_mutex_;
    std::condition_variable capture_cv_;
    bool capturing_ = false;
    bool stop_requested_ = false;
    size_t max_capture_samples_ = 0;
    AudioBuffer captured_;
    std::string capture_path_;
    Handler on_complete_;
    std::thread capture_thread_;
    VoidResult last_capture_result_;

    // Playback
    mutable std::mutex playback_mutex_;
    std::deque<Sample> playback_queue_;
};

AudioIO::AudioIO() : pimpl_(std::make_unique<Impl>()) {}
AudioIO::~AudioIO() = default;

bool AudioIO::start(const AudioConfig& config) {
    return pimpl_->start(config);
}

void AudioIO::stop() {
    pimpl_->stop();
}

VoidResult AudioIO::start_capture(const std::string& path, Handler on_complete) {
    return pimpl_->start_capture(path, std::move(on_complete));
}

VoidResult AudioIO::stop_capture() {
    return pimpl_->stop_capture();
}

bool AudioIO::play(const AudioBuffer& buffer) {
    return pimpl_->play(buffer);
}

bool AudioIO::is_playback_complete() const {
    return pimpl_->is_playback_complete();
}

void AudioIO::stop_playback() {
    pimpl_->stop_playback();
}

int AudioIO::sample_rate() const {
    return pimpl_->sample_rate();
}

void AudioIO::list_devices() {
    Impl::list_devices();
}

} // namespace optidex
