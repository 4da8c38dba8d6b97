#include "display.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <netdb.h>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace optidex {

namespace {

struct ButtonHandlers {
    std::mutex mutex;
    Handler pressed;
    Handler released;
};

} // namespace

class SocketDisplay::Impl {
public:
    Impl(const DisplayConfig& config, Scheduler& scheduler)
        : config_(config)
        , scheduler_(scheduler)
        , handlers_(std::make_shared<ButtonHandlers>()) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (worker_.joinable()) return;
        stopping_ = false;
        worker_ = std::thread([this]() { run(); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
            if (fd_ >= 0) shutdown(fd_, SHUT_RDWR);
        }
        cv_.notify_all();
        if (worker_.joinable()) worker_.join();
    }

    bool connected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fd_ >= 0;
    }

    void update(const DisplayUpdate& update) {
        std::lock_guard<std::mutex> lock(mutex_);
        DisplayUpdate delta = state_.merge(update);
        if (delta.empty()) return;

        std::string line = display_update_to_json(delta);
        if (delta.text) LOG_DISPLAY("send " + line);
        if (fd_ >= 0) send_line(line);
    }

    void set_pressed(Handler handler) {
        std::lock_guard<std::mutex> lock(handlers_->mutex);
        handlers_->pressed = std::move(handler);
    }

    void set_released(Handler handler) {
        std::lock_guard<std::mutex> lock(handlers_->mutex);
        handlers_->released = std::move(handler);
    }

private:
    // =========================================================================
    // Connection
    // =========================================================================

    void run() {
        Logger::set_thread_name("display");
        while (!stopping_) {
            int fd = connect_with_retry();
            if (fd < 0) return;

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_) {
                    close(fd);
                    return;
                }
                fd_ = fd;
                send_line(display_update_to_json(state_.full()));
            }
            Logger::info("Connected to display at " + config_.host + ":" + std::to_string(config_.port));

            read_loop(fd);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                close(fd_);
                fd_ = -1;
            }
            if (!stopping_) Logger::warn("Display connection lost, reconnecting");
        }
    }

    int connect_with_retry() {
        for (int attempt = 1; attempt <= constants::display::CONNECT_RETRIES; ++attempt) {
            if (stopping_) return -1;

            int fd = connect_once();
            if (fd >= 0) return fd;

            LOG_DISPLAY("Connection attempt " + std::to_string(attempt) + " failed, retrying...");
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(constants::display::CONNECT_RETRY_MS),
                         [this] { return stopping_.load(); });
        }
        Logger::error("Failed to connect to display after " +
                      std::to_string(constants::display::CONNECT_RETRIES) + " attempts");
        return -1;
    }

    int connect_once() {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* results = nullptr;
        std::string port = std::to_string(config_.port);
        int rc = getaddrinfo(config_.host.c_str(), port.c_str(), &hints, &results);
        if (rc != 0) {
            LOG_DISPLAY(std::string("getaddrinfo failed: ") + gai_strerror(rc));
            return -1;
        }

        int fd = -1;
        for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
            fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd < 0) continue;
            if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
            close(fd);
            fd = -1;
        }
        freeaddrinfo(results);
        return fd;
    }

    /// Caller holds mutex_
    void send_line(const std::string& line) {
        std::string data = line + "\n";
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                Logger::warn(std::string("Display send failed: ") + std::strerror(errno));
                shutdown(fd_, SHUT_RDWR);
                return;
            }
            sent += static_cast<size_t>(n);
        }
    }

    void read_loop(int fd) {
        std::string pending;
        char buffer[1024];
        while (!stopping_) {
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n < 0) {
                if (errno == EINTR) continue;
                return;
            }
            if (n == 0) return;

            pending.append(buffer, static_cast<size_t>(n));
            size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                handle_message(utils::trim_copy(pending.substr(0, newline)));
                pending.erase(0, newline + 1);
            }
            // The UI may omit the trailing newline on single messages
            if (!pending.empty() && pending.back() == '}') {
                handle_message(utils::trim_copy(pending));
                pending.clear();
            }
        }
    }

    void handle_message(const std::string& message) {
        if (message.empty() || message == "OK") return;

        json j = json::parse(message, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            Logger::warn("Unparsable message from display: " + message);
            return;
        }

        std::string event = j.value("event", "");
        bool pressed = event == "button_pressed";
        if (!pressed && event != "button_released") return;

        LOG_DISPLAY("Button " + std::string(pressed ? "pressed" : "released"));
        std::shared_ptr<ButtonHandlers> handlers = handlers_;
        scheduler_.post([handlers, pressed]() {
            Handler handler;
            {
                std::lock_guard<std::mutex> lock(handlers->mutex);
                handler = pressed ? handlers->pressed : handlers->released;
            }
            if (handler) handler();
        });
    }

    DisplayConfig config_;
    Scheduler& scheduler_;
    std::shared_ptr<ButtonHandlers> handlers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    DisplayState state_;
    int fd_ = -1;
    std::atomic<bool> stopping_{false};
    std::thread worker_;
};

SocketDisplay::SocketDisplay(const DisplayConfig& config, Scheduler& scheduler)
    : pimpl_(std::make_unique<Impl>(config, scheduler)) {}

SocketDisplay::~SocketDisplay() = default;

void SocketDisplay::start() {
    pimpl_->start();
}

void SocketDisplay::stop() {
    pimpl_->stop();
}

bool SocketDisplay::connected() const {
    return pimpl_->connected();
}

void SocketDisplay::update(const DisplayUpdate& update) {
    pimpl_->update(update);
}

void SocketDisplay::on_pressed(Handler handler) {
    pimpl_->set_pressed(std::move(handler));
}

void SocketDisplay::on_released(Handler handler) {
    pimpl_->set_released(std::move(handler));
}

} // namespace optidex
