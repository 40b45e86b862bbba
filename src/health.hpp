#pragma once

#include "engine.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>

class HealthCheck {
public:
    explicit HealthCheck(std::shared_ptr<const InferenceEngine> engine);
    
    nlohmann::json get_status() const;
    bool is_healthy() const;
    
private:
    std::shared_ptr<const InferenceEngine> engine_;
    int64_t started_ms_;
};
