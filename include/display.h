#pragma once

#include "config.h"
#include "core/types.h"
#include "scheduler.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace optidex {

/**
 * @brief Partial display state; unset fields are left as they are
 */
struct DisplayUpdate {
    std::optional<std::string> status;
    std::optional<std::string> emoji;
    std::optional<std::string> text;
    std::optional<std::string> color;   ///< Accent LED color, "#RRGGBB"
    std::optional<std::string> image;   ///< Image path; "" clears the image
    /// Transmit image even when the path is unchanged (live frames rewrite the same file)
    bool force_image = false;

    bool empty() const { return !status && !emoji && !text && !color && !image; }
};

/**
 * @brief Where display updates go
 */
class DisplaySink {
public:
    virtual ~DisplaySink() = default;
    virtual void update(const DisplayUpdate& update) = 0;
};

/**
 * @brief Edge-triggered button
 *
 * Registering a handler replaces the previous one for that edge.
 */
class ButtonInput {
public:
    virtual ~ButtonInput() = default;
    virtual void on_pressed(Handler handler) = 0;
    virtual void on_released(Handler handler) = 0;
};

/**
 * @brief Last-sent display state and delta computation
 *
 * Not thread-safe; owners serialize access.
 */
class DisplayState {
public:
    DisplayState();

    /**
     * @brief Merge an update into the current state
     * @return Fields that differ from what was sent before (plus image when forced)
     */
    DisplayUpdate merge(const DisplayUpdate& update);

    /// Every field, for a fresh connection
    DisplayUpdate full() const;

    const std::string& image() const { return image_; }

private:
    std::string status_;
    std::string emoji_;
    std::string text_;
    std::string color_;
    std::string image_;
};

/**
 * @brief Serialize an update as one JSON line for the display process
 *
 * Keys: status, emoji, text, RGB, image, brightness.
 */
std::string display_update_to_json(const DisplayUpdate& update);

/**
 * @brief Display UI client over TCP, newline-delimited JSON both ways
 *
 * Connects in the background with retries; updates issued before the
 * connection is up are merged into the state that is sent on connect.
 * Button events from the UI are posted to the scheduler and invoke the
 * handler registered at the time they run.
 */
class SocketDisplay : public DisplaySink, public ButtonInput {
public:
    SocketDisplay(const DisplayConfig& config, Scheduler& scheduler);
    ~SocketDisplay() override;

    SocketDisplay(const SocketDisplay&) = delete;
    SocketDisplay& operator=(const SocketDisplay&) = delete;

    /// Start connecting (returns immediately)
    void start();

    /// Disconnect and join background threads
    void stop();

    bool connected() const;

    void update(const DisplayUpdate& update) override;
    void on_pressed(Handler handler) override;
    void on_released(Handler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace optidex
