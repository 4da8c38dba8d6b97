#pragma once

#include "config.h"
#include <functional>
#include <memory>
#include <string>

namespace optidex {

/**
 * @brief Outgoing notifications (chat messages, photos, videos)
 *
 * Fire-and-forget: calls return immediately and failures are only logged.
 */
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void send_text(const std::string& message) = 0;
    virtual void send_photo(const std::string& path) = 0;
    virtual void send_video(const std::string& path) = 0;
};

/**
 * @brief Telegram Bot API client
 *
 * Requests go through a single background sender thread in submission
 * order. With polling enabled, a second thread long-polls getUpdates,
 * learns the chat id from the first message if none is configured, and
 * hands incoming text to the message handler (on the polling thread).
 */
class TelegramNotifier : public Notifier {
public:
    using MessageHandler = std::function<void(const std::string&)>;

    explicit TelegramNotifier(const TelegramConfig& config);
    ~TelegramNotifier() override;

    TelegramNotifier(const TelegramNotifier&) = delete;
    TelegramNotifier& operator=(const TelegramNotifier&) = delete;

    void set_message_handler(MessageHandler handler);

    /// Start the sender (and poller) threads
    void start();

    /// Drop queued requests and join threads
    void stop();

    void send_text(const std::string& message) override;
    void send_photo(const std::string& path) override;
    void send_video(const std::string& path) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace optidex
