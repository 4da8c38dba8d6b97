#include "notifier.h"
#include "core/constants.h"
#include "logger.h"
#include <atomic>
#include <condition_variable>
#include <curl/curl.h>
#include <deque>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;

namespace optidex {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

enum class Outgoing { Text, Photo, Video };

struct OutgoingRequest {
    Outgoing kind;
    std::string payload;   ///< Message text or file path
};

} // namespace

class TelegramNotifier::Impl {
public:
    explicit Impl(const TelegramConfig& config)
        : config_(config), chat_id_(config.chat_id) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        stop();
        curl_global_cleanup();
    }

    void start() {
        if (!config_.enabled) {
            LOG_NOTIFY("Telegram disabled");
            return;
        }
        if (config_.token.empty()) {
            Logger::error("[Notify] Telegram token is missing; notifications disabled");
            return;
        }
        running_ = true;
        sender_ = std::thread([this]() { sender_loop(); });
        if (config_.poll_updates || chat_id().empty()) {
            poller_ = std::thread([this]() { poll_loop(); });
        }
        LOG_NOTIFY("Telegram started" + std::string(chat_id().empty() ? ", waiting for a message to learn the chat id" : ""));
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
            queue_.clear();
        }
        cv_.notify_all();
        if (sender_.joinable()) sender_.join();
        if (poller_.joinable()) poller_.join();
    }

    void enqueue(Outgoing kind, const std::string& payload) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        queue_.push_back(OutgoingRequest{kind, payload});
        cv_.notify_one();
    }

    void set_message_handler(MessageHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        message_handler_ = std::move(handler);
    }

private:
    std::string chat_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return chat_id_;
    }

    std::string base_url() const {
        return std::string(constants::notify::TELEGRAM_API) + config_.token;
    }

    // =========================================================================
    // Sending
    // =========================================================================

    void sender_loop() {
        Logger::set_thread_name("telegram");
        while (true) {
            OutgoingRequest request;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
                if (!running_) return;
                request = std::move(queue_.front());
                queue_.pop_front();
            }
            deliver(request);
        }
    }

    void deliver(const OutgoingRequest& request) {
        std::string chat = chat_id();
        if (chat.empty()) {
            Logger::warn("[Notify] No chat id yet; dropping notification");
            return;
        }

        switch (request.kind) {
            case Outgoing::Text: {
                json body;
                body["chat_id"] = chat;
                body["text"] = request.payload;
                post_json("sendMessage", body.dump(-1, ' ', false, json::error_handler_t::replace));
                break;
            }
            case Outgoing::Photo:
                post_file("sendPhoto", "photo", chat, request.payload);
                break;
            case Outgoing::Video:
                post_file("sendVideo", "video", chat, request.payload);
                break;
        }
    }

    bool post_json(const std::string& method, const std::string& body) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            Logger::error("[Notify] Failed to initialize CURL");
            return false;
        }

        std::string url = base_url() + "/" + method;
        std::string response_buffer;
        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, constants::notify::SEND_TIMEOUT_MS);

        bool ok = perform(curl, method, response_buffer);

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        return ok;
    }

    bool post_file(const std::string& method, const char* field,
                   const std::string& chat, const std::string& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            Logger::warn("[Notify] File not found: " + path);
            return false;
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            Logger::error("[Notify] Failed to initialize CURL");
            return false;
        }

        LOG_NOTIFY(method + " " + path);
        std::string url = base_url() + "/" + method;
        std::string response_buffer;

        curl_mime* mime = curl_mime_init(curl);
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, "chat_id");
        curl_mime_data(part, chat.c_str(), CURL_ZERO_TERMINATED);

        part = curl_mime_addpart(mime);
        curl_mime_name(part, field);
        curl_mime_filedata(part, path.c_str());

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, constants::notify::SEND_TIMEOUT_MS * 4);

        bool ok = perform(curl, method, response_buffer);

        curl_mime_free(mime);
        curl_easy_cleanup(curl);
        return ok;
    }

    bool perform(CURL* curl, const std::string& method, const std::string& response_buffer) {
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            Logger::error("[Notify] " + method + " failed: " + curl_easy_strerror(res));
            return false;
        }
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        if (http_code != 200) {
            Logger::error("[Notify] " + method + " failed: HTTP " + std::to_string(http_code) +
                          " " + response_buffer.substr(0, 200));
            return false;
        }
        return true;
    }

    // =========================================================================
    // Polling
    // =========================================================================

    void poll_loop() {
        Logger::set_thread_name("telegram poll");
        while (running_) {
            if (!poll_once()) {
                // Back off after an error so a dead network does not spin
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, std::chrono::seconds(2), [this] { return !running_; });
            }
        }
    }

    bool poll_once() {
        CURL* curl = curl_easy_init();
        if (!curl) return false;

        std::string url = base_url() + "/getUpdates?timeout=" +
                          std::to_string(constants::notify::POLL_TIMEOUT_S);
        if (last_update_id_ > 0) {
            url += "&offset=" + std::to_string(last_update_id_ + 1);
        }

        std::string response_buffer;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(constants::notify::POLL_TIMEOUT_S + 5));
        // Lets stop() interrupt a long poll
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &Impl::progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, this);

        CURLcode res = curl_easy_perform(curl);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            if (running_) Logger::warn(std::string("[Notify] getUpdates failed: ") + curl_easy_strerror(res));
            return false;
        }

        json data = json::parse(response_buffer, nullptr, false);
        if (data.is_discarded() || !data.value("ok", false)) {
            Logger::warn("[Notify] Unexpected getUpdates response");
            return false;
        }

        try {
            for (const auto& update : data["result"]) {
                last_update_id_ = update.value("update_id", last_update_id_);
                if (!update.contains("message")) continue;
                handle_message(update["message"]);
            }
        } catch (const json::exception& e) {
            Logger::warn(std::string("[Notify] Bad update: ") + e.what());
        }
        return true;
    }

    void handle_message(const json& message) {
        if (!message.contains("chat")) return;

        bool learned = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (chat_id_.empty()) {
                chat_id_ = message["chat"]["id"].dump();
                learned = true;
            }
        }
        if (learned) {
            LOG_NOTIFY("Chat id learned: " + chat_id());
            enqueue(Outgoing::Text, "Connected to Optidex! I will send you updates here.");
        }

        std::string text = message.value("text", "");
        if (text.empty() || text == "/start" || !config_.poll_updates) return;

        MessageHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = message_handler_;
        }
        LOG_NOTIFY("Received: " + text);
        if (handler) handler(text);
    }

    static int progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* self = static_cast<Impl*>(userp);
        return self->running_ ? 0 : 1;
    }

    TelegramConfig config_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<OutgoingRequest> queue_;
    std::string chat_id_;
    MessageHandler message_handler_;
    std::atomic<bool> running_{false};
    int64_t last_update_id_ = 0;
    std::thread sender_;
    std::thread poller_;
};

TelegramNotifier::TelegramNotifier(const TelegramConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

TelegramNotifier::~TelegramNotifier() = default;

void TelegramNotifier::set_message_handler(MessageHandler handler) {
    pimpl_->set_message_handler(std::move(handler));
}

void TelegramNotifier::start() {
    pimpl_->start();
}

void TelegramNotifier::stop() {
    pimpl_->stop();
}

void TelegramNotifier::send_text(const std::string& message) {
    LOG_NOTIFY("Queue text: " + message);
    pimpl_->enqueue(Outgoing::Text, message);
}

void TelegramNotifier::send_photo(const std::string& path) {
    pimpl_->enqueue(Outgoing::Photo, path);
}

void TelegramNotifier::send_video(const std::string& path) {
    pimpl_->enqueue(Outgoing::Video, path);
}

} // namespace optidex
