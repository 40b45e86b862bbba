#include "config.hpp"
#include "bundle.hpp"
#include "engine.hpp"
#include "health.hpp"
#include "api_server.hpp"
#include "prediction_tracker.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.service_name, config.log_level);
        config.validate();
        
        spdlog::info("Starting {} on {}:{}", config.service_name, config.listen_addr, config.listen_port);
        
        // The server only starts once the bundle has loaded and validated
        std::shared_ptr<const ModelBundle> bundle;
        try {
            bundle = BundleLoader::load(config.bundle_dir);
        } catch (const BundleLoadError& e) {
            spdlog::critical("Failed to load model bundle from {}: {}", config.bundle_dir, e.what());
            return 1;
        }
        
        auto tracker = std::make_shared<PredictionTracker>(static_cast<size_t>(config.tracker_window));
        auto engine = std::make_shared<InferenceEngine>(bundle, EngineOptions::from_config(config), tracker);
        HealthCheck health(engine);
        
        ApiServer server(config, engine, health, tracker);
        server.start();
        
        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);
        
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        
        spdlog::info("Shutting down gracefully");
        server.stop();
        engine->shutdown();
        
        spdlog::info("Shutdown complete ({} predictions served)", tracker->total_predictions());
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
