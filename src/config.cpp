#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        size_t used = 0;
        int parsed = std::stoi(val, &used);
        if (used != std::strlen(val)) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    double parsed = 0.0;
    if (!util::parse_double(val, parsed)) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
    return parsed;
}

std::optional<double> Config::get_env_optional_double(const char* name) {
    const char* val = std::getenv(name);
    if (!val || std::string(val).empty()) return std::nullopt;
    double parsed = 0.0;
    if (!util::parse_double(val, parsed)) {
        spdlog::warn("Invalid number for {}, ignoring override", name);
        return std::nullopt;
    }
    return parsed;
}

Config Config::from_env() {
    Config cfg;
    
    cfg.bundle_dir = get_env("BUNDLE_DIR");
    
    cfg.min_quorum = get_env_int("MIN_QUORUM", 10);
    cfg.schema_mode = get_env("SCHEMA_MODE", "strict");
    cfg.tier_low_override = get_env_optional_double("TIER_LOW");
    cfg.tier_high_override = get_env_optional_double("TIER_HIGH");
    cfg.top_features = get_env_int("TOP_FEATURES", 10);
    cfg.ood_z_threshold = get_env_double("OOD_Z_THRESHOLD", 4.0);
    
    cfg.worker_threads = get_env_int("WORKER_THREADS", 4);
    cfg.explain_workers = get_env_int("EXPLAIN_WORKERS", 2);
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 2000);
    cfg.explain_timeout_ms = get_env_int("EXPLAIN_TIMEOUT_MS", 5000);
    
    cfg.tracker_window = get_env_int("TRACKER_WINDOW", 1000);
    
    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8001);
    
    cfg.service_name = get_env("SERVICE_NAME", "fraudfusion");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::validate() const {
    if (bundle_dir.empty()) {
        throw std::runtime_error("BUNDLE_DIR is required");
    }
    if (schema_mode != "strict" && schema_mode != "lenient") {
        throw std::runtime_error("SCHEMA_MODE must be 'strict' or 'lenient'");
    }
    if (min_quorum < 1) {
        throw std::runtime_error("MIN_QUORUM must be at least 1");
    }
    if (worker_threads < 0 || explain_workers < 0) {
        throw std::runtime_error("WORKER_THREADS and EXPLAIN_WORKERS must be non-negative");
    }
    if (request_timeout_ms <= 0 || explain_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_MS and EXPLAIN_TIMEOUT_MS must be positive");
    }
    if (top_features < 1) {
        throw std::runtime_error("TOP_FEATURES must be at least 1");
    }
    if (tracker_window < 1) {
        throw std::runtime_error("TRACKER_WINDOW must be at least 1");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Bundle: {}", bundle_dir);
    spdlog::info("  Quorum: {}, schema mode: {}", min_quorum, schema_mode);
    spdlog::info("  Workers: scoring={}, explain={}", worker_threads, explain_workers);
    spdlog::info("  Budgets: request={}ms, explain={}ms", request_timeout_ms, explain_timeout_ms);
}
