// ============================================================================
// ALGOSTREAM - CLI Host
// ============================================================================
// Polls watched feeds on a fixed tick, the way a worksheet recalculates
//
//   algostream_cli --config <file.yaml> [--watch SYMBOL:EXCHANGE:MODE ...]
//                  [--interval-ms N] [--url ws://...]
// ============================================================================

#include "algostream/config/session_config.hpp"
#include "algostream/core/error.hpp"
#include "algostream/stream/streaming_session.hpp"
#include "algostream/utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int) {
        g_running = false;
    }

    void print_usage(const char* program) {
        std::cerr << "Usage: " << program
                  << " --config <file.yaml> [--watch SYMBOL:EXCHANGE:MODE ...]"
                     " [--interval-ms N] [--url ws://host:port]\n";
    }

    std::string describe(const algostream::stream::ReadResult& result) {
        using algostream::stream::ReadStatus;
        if (result.status != ReadStatus::Data) {
            return result.to_display_string();
        }
        const auto& snapshot = *result.snapshot;
        std::string text = snapshot.ltp ? "ltp=" + std::to_string(*snapshot.ltp) : std::string("ltp=N/A");
        text += " fields=" + std::to_string(snapshot.fields.size());
        if (snapshot.depth) {
            text += " depth=" + std::to_string(snapshot.depth->rows());
        }
        return text;
    }
}

using namespace algostream;

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_path;
    std::string url_override;
    std::vector<std::string> watch_args;
    std::optional<int64_t> interval_ms;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--watch" && i + 1 < argc) {
            watch_args.emplace_back(argv[++i]);
        } else if (arg == "--interval-ms" && i + 1 < argc) {
            char* end = nullptr;
            const long long value = std::strtoll(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || value <= 0) {
                std::cerr << "[ERROR] --interval-ms expects a positive integer\n";
                return 2;
            }
            interval_ms = value;
        } else if (arg == "--url" && i + 1 < argc) {
            url_override = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "[ERROR] Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    if (config_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    config::AppConfig app;
    try {
        app = config::load_config(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    for (const auto& entry : watch_args) {
        auto key = config::parse_watch_entry(entry);
        if (!key) {
            std::cerr << "[ERROR] Invalid --watch entry '" << entry << "' (expected SYMBOL:EXCHANGE:MODE)\n";
            return 2;
        }
        app.watch.push_back(std::move(*key));
    }
    if (interval_ms) {
        app.poll_interval = std::chrono::milliseconds{*interval_ms};
    }
    if (!url_override.empty()) {
        app.session.url = url_override;
    }

    if (app.session.api_key.empty()) {
        std::cerr << "\n[ERROR] API key not configured!\n";
        std::cerr << "[HINT] Set connection.api_key in " << config_path
                  << " or export " << config::API_KEY_ENV << "\n\n";
        return 1;
    }

    utils::Logger::init(app.logging);
    LOG_INFO("AlgoStream CLI starting ({} watched feed(s), {}ms tick)",
             app.watch.size(), app.poll_interval.count());

    int exit_code = 0;
    {
        stream::StreamingSession session(app.session);
        session.on_data([](const SubscriptionKey& key) {
            LOG_DEBUG("update {}", key.to_string());
        });

        Status opened = session.open();
        if (!opened.ok()) {
            LOG_ERROR("{}", opened.to_string());
            exit_code = 1;
        } else {
            LOG_INFO("{}", opened.message());
        }

        while (exit_code == 0 && g_running) {
            for (const auto& key : app.watch) {
                auto result = session.feed().read(key);
                std::cout << key.to_string() << "  " << describe(result) << "\n";
            }
            std::cout.flush();

            const auto deadline = std::chrono::steady_clock::now() + app.poll_interval;
            while (g_running && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }

        LOG_INFO("Shutting down ({})", session.unsubscribe_all());
        session.close();

        const auto stats = session.dispatcher().stats();
        LOG_INFO("Session stats: admitted={} dropped={} heartbeats={} malformed={}",
                 stats.admitted, stats.dropped, stats.heartbeats, stats.malformed);
    }

    utils::Logger::shutdown();
    return exit_code;
}
