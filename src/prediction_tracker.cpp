#include "prediction_tracker.hpp"
#include "util.hpp"
#include <algorithm>

double ModelStats::window_mean() const {
    if (window.empty()) return 0.0;
    double sum = 0.0;
    for (double v : window) sum += v;
    return sum / static_cast<double>(window.size());
}

PredictionTracker::PredictionTracker(size_t window, double ema_alpha)
    : window_(std::max<size_t>(1, window)), ema_alpha_(ema_alpha) {}

void PredictionTracker::record_prediction(const std::vector<BaseScore>& scores, RiskTier tier,
                                          double p_cal) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    ++total_;
    p_cal_sum_ += p_cal;
    ++tiers_[tier];
    
    for (const auto& s : scores) {
        ModelStats& st = models_[s.model];
        if (!s.available) {
            ++st.unavailable;
            continue;
        }
        
        if (st.scored == 0) {
            st.ema = s.probability;
            st.min = s.probability;
            st.max = s.probability;
        } else {
            st.ema = ema_alpha_ * s.probability + (1.0 - ema_alpha_) * st.ema;
            st.min = std::min(st.min, s.probability);
            st.max = std::max(st.max, s.probability);
        }
        ++st.scored;
        
        st.window.push_back(s.probability);
        while (st.window.size() > window_) {
            st.window.pop_front();
        }
    }
}

void PredictionTracker::record_failure(ErrorKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failures_[kind];
}

int64_t PredictionTracker::total_predictions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

int64_t PredictionTracker::tier_count(RiskTier tier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tiers_.find(tier);
    return it == tiers_.end() ? 0 : it->second;
}

int64_t PredictionTracker::failure_count(ErrorKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failures_.find(kind);
    return it == failures_.end() ? 0 : it->second;
}

ModelStats PredictionTracker::model_stats(const std::string& model) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = models_.find(model);
    return it == models_.end() ? ModelStats() : it->second;
}

nlohmann::json PredictionTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    nlohmann::json tiers = nlohmann::json::object();
    for (auto tier : {RiskTier::Safe, RiskTier::Suspicious, RiskTier::Fraud}) {
        auto it = tiers_.find(tier);
        tiers[risk_tier_string(tier)] = it == tiers_.end() ? 0 : it->second;
    }
    
    nlohmann::json failures = nlohmann::json::object();
    for (const auto& [kind, count] : failures_) {
        failures[error_kind_string(kind)] = count;
    }
    
    nlohmann::json models = nlohmann::json::object();
    for (const auto& [name, st] : models_) {
        models[name] = {
            {"scored", st.scored},
            {"unavailable", st.unavailable},
            {"window_size", st.window.size()},
            {"window_mean", st.window_mean()},
            {"ema", st.ema},
            {"min", st.min},
            {"max", st.max}
        };
    }
    
    return {
        {"total_predictions", total_},
        {"mean_probability", total_ > 0 ? p_cal_sum_ / static_cast<double>(total_) : 0.0},
        {"tiers", tiers},
        {"failures", failures},
        {"models", models},
        {"ts", util::current_iso8601()}
    };
}
