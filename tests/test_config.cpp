#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/config.hpp"
#include "../src/engine.hpp"
#include <cstdlib>

using Catch::Matchers::WithinAbs;

namespace {

const char* kVars[] = {
    "BUNDLE_DIR", "MIN_QUORUM", "SCHEMA_MODE", "TIER_LOW", "TIER_HIGH", "TOP_FEATURES",
    "OOD_Z_THRESHOLD", "WORKER_THREADS", "EXPLAIN_WORKERS", "REQUEST_TIMEOUT_MS",
    "EXPLAIN_TIMEOUT_MS", "TRACKER_WINDOW", "LISTEN_ADDR", "LISTEN_PORT", "SERVICE_NAME", "LOG_LEVEL"
};

// Clears the service's variables for the duration of a test
struct CleanEnv {
    CleanEnv() { clear(); }
    ~CleanEnv() { clear(); }
    
    static void clear() {
        for (const char* name : kVars) unsetenv(name);
    }
};

} // namespace

TEST_CASE("Config from environment", "[config]") {
    CleanEnv env;
    
    SECTION("Defaults") {
        Config cfg = Config::from_env();
        REQUIRE(cfg.bundle_dir.empty());
        REQUIRE(cfg.min_quorum == 10);
        REQUIRE(cfg.schema_mode == "strict");
        REQUIRE_FALSE(cfg.tier_low_override.has_value());
        REQUIRE(cfg.top_features == 10);
        REQUIRE_THAT(cfg.ood_z_threshold, WithinAbs(4.0, 1e-12));
        REQUIRE(cfg.worker_threads == 4);
        REQUIRE(cfg.request_timeout_ms == 2000);
        REQUIRE(cfg.explain_timeout_ms == 5000);
        REQUIRE(cfg.listen_port == 8001);
        REQUIRE(cfg.service_name == "fraudfusion");
    }
    
    SECTION("Overrides") {
        setenv("BUNDLE_DIR", "/models/current", 1);
        setenv("MIN_QUORUM", "8", 1);
        setenv("SCHEMA_MODE", "lenient", 1);
        setenv("TIER_LOW", "0.25", 1);
        setenv("TIER_HIGH", "0.8", 1);
        setenv("LISTEN_PORT", "9100", 1);
        
        Config cfg = Config::from_env();
        REQUIRE(cfg.bundle_dir == "/models/current");
        REQUIRE(cfg.min_quorum == 8);
        REQUIRE_THAT(cfg.tier_low_override.value(), WithinAbs(0.25, 1e-12));
        REQUIRE_THAT(cfg.tier_high_override.value(), WithinAbs(0.8, 1e-12));
        REQUIRE(cfg.listen_port == 9100);
        REQUIRE_NOTHROW(cfg.validate());
        
        EngineOptions o = EngineOptions::from_config(cfg);
        REQUIRE(o.min_quorum == 8);
        REQUIRE(o.schema_mode == SchemaMode::Lenient);
        REQUIRE_THAT(o.tier_low.value(), WithinAbs(0.25, 1e-12));
    }
    
    SECTION("Malformed numbers fall back to defaults") {
        setenv("MIN_QUORUM", "ten", 1);
        setenv("OOD_Z_THRESHOLD", "high", 1);
        setenv("TIER_LOW", "low", 1);
        
        Config cfg = Config::from_env();
        REQUIRE(cfg.min_quorum == 10);
        REQUIRE_THAT(cfg.ood_z_threshold, WithinAbs(4.0, 1e-12));
        REQUIRE_FALSE(cfg.tier_low_override.has_value());
    }
    
    SECTION("Integers with trailing characters fall back to defaults") {
        setenv("WORKER_THREADS", "12abc", 1);
        setenv("LISTEN_PORT", "80 80", 1);
        setenv("TOP_FEATURES", "7", 1);
        
        Config cfg = Config::from_env();
        REQUIRE(cfg.worker_threads == 4);
        REQUIRE(cfg.listen_port == 8001);
        REQUIRE(cfg.top_features == 7);
    }
    
    SECTION("Validation") {
        Config cfg = Config::from_env();
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
        
        cfg.bundle_dir = "/models/current";
        REQUIRE_NOTHROW(cfg.validate());
        
        cfg.schema_mode = "loose";
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
        cfg.schema_mode = "strict";
        
        cfg.request_timeout_ms = 0;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
        cfg.request_timeout_ms = 2000;
        
        cfg.min_quorum = 0;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }
}
