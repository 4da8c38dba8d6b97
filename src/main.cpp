#include "agent.h"
#include "audio_io.h"
#include "config.h"
#include "logger.h"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace optidex {
namespace {

Application* g_app = nullptr;

void handle_signal(int) {
    if (g_app) {
        g_app->request_stop();
    }
}

struct Options {
    std::string config_path;
    std::optional<std::string> log_level;
    bool list_devices = false;
};

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--list-devices] [--log-level LEVEL] [config.json | config_dir]\n";
}

/// config/config.json in the working directory, else next to the executable's parent (build/../config)
std::string default_config_path() {
    const std::string local = "config/config.json";
    std::error_code ec;
    if (fs::exists(local, ec)) return local;

    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len > 0) {
        buf[len] = '\0';
        fs::path candidate = fs::path(buf).parent_path().parent_path() / "config" / "config.json";
        if (fs::exists(candidate, ec)) return candidate.string();
    }
    return local;
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            options.list_devices = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            options.log_level = argv[++i];
        } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
            options.config_path = arg;
        } else {
            return std::nullopt;
        }
    }
    if (options.config_path.empty()) {
        options.config_path = default_config_path();
    }
    return options;
}

} // namespace
} // namespace optidex

int main(int argc, char* argv[]) {
    using namespace optidex;

    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    Logger::initialize(LogLevel::INFO);
    if (options->list_devices) {
        AudioIO::list_devices();
        Logger::shutdown();
        return 0;
    }

    Config config = Config::load_from_file(options->config_path);
    if (options->log_level) {
        config.log_level = *options->log_level;
    }

    // Reopen with the configured level and file
    Logger::shutdown();
    Logger::initialize(parse_log_level(config.log_level), config.log_file);
    Logger::set_thread_name("main");

    Application app(config);
    g_app = &app;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int result = app.run();

    g_app = nullptr;
    Logger::shutdown();
    return result;
}
