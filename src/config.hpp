#pragma once

#include <string>
#include <cstdlib>
#include <optional>

struct Config {
    // Model bundle
    std::string bundle_dir;
    
    // Engine policy
    int min_quorum;
    std::string schema_mode;   // "strict" or "lenient"
    std::optional<double> tier_low_override;
    std::optional<double> tier_high_override;
    int top_features;
    double ood_z_threshold;
    
    // Concurrency and budgets
    int worker_threads;
    int explain_workers;
    int request_timeout_ms;
    int explain_timeout_ms;
    
    // Observability
    int tracker_window;
    
    // HTTP
    std::string listen_addr;
    int listen_port;
    
    // Service
    std::string service_name;
    std::string log_level;
    
    static Config from_env();
    void validate() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static std::optional<double> get_env_optional_double(const char* name);
};
