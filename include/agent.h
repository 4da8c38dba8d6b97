#pragma once

#include "config.h"
#include <memory>

namespace optidex {

/**
 * @brief Composition root for the device
 *
 * Owns every collaborator, wires them to the turn controller and runs the
 * event loop on the calling thread until a stop is requested.
 */
class Application {
public:
    explicit Application(const Config& config);
    ~Application();

    // Non-copyable
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Create and start all components
     * @return False if a required component (audio) failed
     */
    bool initialize();

    /**
     * @brief Run the event loop until request_stop()
     * @return Exit code (0 for success, non-zero for error)
     */
    int run();

    /**
     * @brief Ask run() to return; async-signal-safe
     */
    void request_stop();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace optidex
