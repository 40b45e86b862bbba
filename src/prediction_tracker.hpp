#pragma once

#include "decision.hpp"
#include "errors.hpp"
#include "model_registry.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

struct ModelStats {
    std::deque<double> window;   // most recent scores, bounded
    double ema = 0.0;
    double min = 0.0;
    double max = 0.0;
    int64_t scored = 0;
    int64_t unavailable = 0;
    
    double window_mean() const;
};

// Rolling observability state; read by /stats, never by scoring
class PredictionTracker {
public:
    explicit PredictionTracker(size_t window, double ema_alpha = 0.1);
    
    void record_prediction(const std::vector<BaseScore>& scores, RiskTier tier, double p_cal);
    void record_failure(ErrorKind kind);
    
    int64_t total_predictions() const;
    int64_t tier_count(RiskTier tier) const;
    int64_t failure_count(ErrorKind kind) const;
    ModelStats model_stats(const std::string& model) const;
    
    nlohmann::json snapshot() const;
    
private:
    size_t window_;
    double ema_alpha_;
    mutable std::mutex mutex_;
    
    int64_t total_ = 0;
    double p_cal_sum_ = 0.0;
    std::map<RiskTier, int64_t> tiers_;
    std::map<ErrorKind, int64_t> failures_;
    std::map<std::string, ModelStats> models_;
};
