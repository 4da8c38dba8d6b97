/**
 * @file piper_tts.cpp
 * @brief Piper TTS implementation
 */

#include "tts/piper_tts.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include "wav_io.h"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <list>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <unistd.h>

namespace optidex {
namespace tts {

namespace {

/**
 * @brief LRU Cache for synthesized phrases
 */
template<typename K, typename V>
class LRUCache {
public:
    explicit LRUCache(size_t capacity) : capacity_(capacity) {}

    std::optional<V> get(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }

        // Move to front (most recently used)
        list_.splice(list_.begin(), list_, it->second);
        return it->second->second;
    }

    void put(const K& key, const V& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = map_.find(key);
        if (it != map_.end()) {
            it->second->second = value;
            list_.splice(list_.begin(), list_, it->second);
            return;
        }

        if (list_.size() >= capacity_) {
            map_.erase(list_.back().first);
            list_.pop_back();
        }

        list_.emplace_front(key, value);
        map_[key] = list_.begin();
    }

private:
    size_t capacity_;
    std::list<std::pair<K, V>> list_;
    std::unordered_map<K, typename std::list<std::pair<K, V>>::iterator> map_;
    std::mutex mutex_;
};

struct SpeechJob {
    std::vector<std::string> sentences;
    std::promise<bool> done;
    uint64_t generation = 0;
};

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out + "'";
}

} // namespace

/**
 * @brief Implementation details for PiperTTS
 */
class PiperTTS::Impl {
public:
    Impl(const TTSConfig& config, AudioIO& audio)
        : config_(config)
        , audio_(audio)
        , cache_(constants::tts::MAX_CACHE_ENTRIES)
    {
        worker_ = std::thread([this]() { run(); });
        LOG_TTS("PiperTTS initialized: voice=" + config.voice_path +
                ", gain=" + std::to_string(config.output_gain));
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_all();
        if (worker_.joinable()) worker_.join();
        for (auto& job : queue_) job.done.set_value(false);
    }

    VoidResult warmup() {
        auto found = find_piper();
        if (found.is_error()) return found;

        std::error_code ec;
        if (!std::filesystem::exists(utils::expand_path(config_.voice_path), ec)) {
            return make_io_error("Voice model not found: " + config_.voice_path);
        }
        LOG_TTS("TTS warmup complete");
        return VoidResult();
    }

    std::shared_future<bool> speak(const std::string& text) {
        SpeechJob job;
        job.sentences = utils::split_sentences(text);
        std::shared_future<bool> future = job.done.get_future().share();

        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            job.done.set_value(false);
            return future;
        }
        job.generation = generation_;
        queue_.push_back(std::move(job));
        cv_.notify_one();
        return future;
    }

    void stop_playback() {
        std::deque<SpeechJob> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++generation_;
            dropped.swap(queue_);
        }
        audio_.stop_playback();
        for (auto& job : dropped) job.done.set_value(false);
        cv_.notify_all();
    }

    void set_sentence_callback(SentenceCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        sentence_callback_ = std::move(callback);
    }

    Result<AudioBuffer> synth(const std::string& text) {
        auto cached = cache_.get(text);
        if (cached) {
            return *cached;
        }

        auto result = synthesize_uncached(text);
        if (result.is_ok() && text.length() <= constants::tts::MAX_CACHE_TEXT_LENGTH) {
            cache_.put(text, result.value());
        }
        return result;
    }

private:
    // =========================================================================
    // Speech thread
    // =========================================================================

    void run() {
        Logger::set_thread_name("tts");
        while (true) {
            SpeechJob job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
                if (!running_) return;
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            job.done.set_value(play_job(job));
        }
    }

    bool interrupted(uint64_t generation) {
        std::lock_guard<std::mutex> lock(mutex_);
        return !running_ || generation != generation_;
    }

    bool play_job(const SpeechJob& job) {
        for (const auto& sentence : job.sentences) {
            if (interrupted(job.generation)) return false;

            auto audio = synth(sentence);
            if (audio.is_error()) {
                Logger::error("[TTS] " + audio.error().to_string());
                return false;
            }
            if (interrupted(job.generation)) return false;

            SentenceCallback callback;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                callback = sentence_callback_;
            }
            if (callback) callback(sentence);

            if (!audio_.play(audio.value())) {
                Logger::error("[TTS] Audio output is not running");
                return false;
            }
            while (!audio_.is_playback_complete()) {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, std::chrono::milliseconds(constants::tts::PLAYBACK_POLL_MS));
                if (!running_ || job.generation != generation_) return false;
            }
        }
        return true;
    }

    // =========================================================================
    // Piper Interaction
    // =========================================================================

    VoidResult find_piper() {
        std::lock_guard<std::mutex> lock(path_mutex_);
        if (!piper_path_.empty()) {
            return VoidResult();
        }

        if (!config_.piper_path.empty()) {
            std::string path = utils::expand_path(config_.piper_path);
            if (access(path.c_str(), X_OK) == 0) {
                piper_path_ = path;
                LOG_TTS("Using custom piper path: " + piper_path_);
                return VoidResult();
            }
            return make_io_error("Custom piper path not found: " + config_.piper_path);
        }

        std::vector<std::string> search_paths = {"/usr/local/bin/piper", "/usr/bin/piper"};
        if (const char* env = std::getenv("PATH")) {
            std::stringstream ss(env);
            std::string dir;
            while (std::getline(ss, dir, ':')) {
                if (!dir.empty()) search_paths.push_back(dir + "/piper");
            }
        }

        for (const auto& path : search_paths) {
            if (access(path.c_str(), X_OK) == 0) {
                piper_path_ = path;
                LOG_TTS("Found piper at: " + piper_path_);
                return VoidResult();
            }
        }

        return make_io_error("Piper binary not found. Install piper or set tts.piper_path in config.");
    }

    Result<AudioBuffer> synthesize_uncached(const std::string& text) {
        auto found = find_piper();
        if (found.is_error()) {
            return found.error();
        }

        auto start_time = Clock::now();
        std::string stamp = std::to_string(Clock::now().time_since_epoch().count());
        std::string temp_txt = "/tmp/optidex_tts_" + stamp + ".txt";
        std::string temp_wav = "/tmp/optidex_tts_" + stamp + ".wav";

        {
            std::FILE* f = std::fopen(temp_txt.c_str(), "w");
            if (!f) {
                return make_io_error("Cannot write " + temp_txt);
            }
            std::fputs(text.c_str(), f);
            std::fclose(f);
        }

        std::ostringstream cmd;
        cmd << shell_quote(piper_path_)
            << " --model " << shell_quote(utils::expand_path(config_.voice_path));
        if (!config_.espeak_data_path.empty()) {
            cmd << " --espeak_data " << shell_quote(config_.espeak_data_path);
        }
        cmd << " --output_file " << shell_quote(temp_wav)
            << " < " << shell_quote(temp_txt)
            << " 2>/dev/null";

        LOG_TTS("Synthesizing: \"" + text + "\"");
        int ret = std::system(cmd.str().c_str());
        std::remove(temp_txt.c_str());

        if (ret != 0) {
            std::remove(temp_wav.c_str());
            return make_error(ErrorType::IOError, "Piper command failed with code: " + std::to_string(ret));
        }

        auto wav = read_wav(temp_wav);
        std::remove(temp_wav.c_str());
        if (wav.is_error()) {
            return wav.error();
        }

        AudioBuffer samples = resample(wav.value().samples, wav.value().sample_rate, audio_.sample_rate());
        if (samples.empty()) {
            return make_io_error("Piper produced no audio");
        }
        apply_gain(samples);

        LOG_TTS("Synthesized " + std::to_string(samples.size()) + " samples in " +
                std::to_string(ms_since(start_time)) + "ms");
        return samples;
    }

    void apply_gain(AudioBuffer& samples) const {
        if (std::abs(config_.output_gain - 1.0f) < 0.001f) return;

        for (auto& sample : samples) {
            float scaled = static_cast<float>(sample) * config_.output_gain;
            sample = static_cast<Sample>(std::clamp(scaled, -32768.0f, 32767.0f));
        }
    }

    // =========================================================================
    // Member Variables
    // =========================================================================

    TTSConfig config_;
    AudioIO& audio_;
    LRUCache<std::string, AudioBuffer> cache_;

    std::mutex path_mutex_;
    std::string piper_path_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SpeechJob> queue_;
    uint64_t generation_ = 0;
    bool running_ = true;
    SentenceCallback sentence_callback_;
    std::thread worker_;
};

// =============================================================================
// Public Interface Implementation
// =============================================================================

PiperTTS::PiperTTS(const TTSConfig& config, AudioIO& audio)
    : impl_(std::make_unique<Impl>(config, audio)) {}

PiperTTS::~PiperTTS() = default;

VoidResult PiperTTS::warmup() {
    return impl_->warmup();
}

std::shared_future<bool> PiperTTS::speak(const std::string& text) {
    return impl_->speak(text);
}

void PiperTTS::stop_playback() {
    impl_->stop_playback();
}

void PiperTTS::set_sentence_callback(SentenceCallback callback) {
    impl_->set_sentence_callback(std::move(callback));
}

Result<AudioBuffer> PiperTTS::synth(const std::string& text) {
    return impl_->synth(text);
}

} // namespace tts
} // namespace optidex
