#include "decision.hpp"
#include "util.hpp"
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>

std::string risk_tier_string(RiskTier tier) {
    switch (tier) {
        case RiskTier::Safe: return "SAFE";
        case RiskTier::Suspicious: return "SUSPICIOUS";
        case RiskTier::Fraud: return "FRAUD";
    }
    return "SAFE";
}

void DecisionConfig::validate() const {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw std::invalid_argument(fmt::format("threshold {} outside [0,1]", threshold));
    }
    if (!(tier_low >= 0.0 && tier_high <= 1.0 && tier_low < tier_high)) {
        throw std::invalid_argument(
            fmt::format("tier bands must satisfy 0 <= low < high <= 1 (low={}, high={})",
                        tier_low, tier_high));
    }
}

RiskTier classify(double p, double tier_low, double tier_high) {
    if (p < tier_low) return RiskTier::Safe;
    if (p >= tier_high) return RiskTier::Fraud;
    return RiskTier::Suspicious;
}

double decision_confidence(double p) {
    return std::fabs(2.0 * util::clamp01(p) - 1.0);
}

Decision decide(double p_cal, const DecisionConfig& config) {
    Decision d;
    d.binary = p_cal >= config.threshold;
    d.tier = classify(p_cal, config.tier_low, config.tier_high);
    d.confidence = decision_confidence(p_cal);
    return d;
}

std::string risk_level_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::VeryLow: return "VERY_LOW";
        case RiskLevel::Low: return "LOW";
        case RiskLevel::Medium: return "MEDIUM";
        case RiskLevel::High: return "HIGH";
        case RiskLevel::Critical: return "CRITICAL";
    }
    return "VERY_LOW";
}

RiskLevel risk_level(double p) {
    if (p >= 0.8) return RiskLevel::Critical;
    if (p >= 0.6) return RiskLevel::High;
    if (p >= 0.4) return RiskLevel::Medium;
    if (p >= 0.2) return RiskLevel::Low;
    return RiskLevel::VeryLow;
}

std::vector<std::string> recommendations(RiskTier tier, const std::vector<std::string>& factor_names) {
    std::vector<std::string> recs;
    
    auto mentions = [&](const std::string& needle) {
        for (const auto& name : factor_names) {
            if (name.find(needle) != std::string::npos) return true;
        }
        return false;
    };
    
    switch (tier) {
        case RiskTier::Fraud:
            recs.push_back("BLOCK transaction immediately");
            recs.push_back("Flag account for comprehensive security review");
            recs.push_back("Initiate customer verification process");
            if (mentions("Extremely High")) {
                recs.push_back("Escalate to fraud investigation team");
            }
            if (mentions("Disagreement") || factor_names.size() >= 3) {
                recs.push_back("Review recent transaction history for patterns");
            }
            break;
        case RiskTier::Suspicious:
            recs.push_back("REVIEW transaction manually");
            recs.push_back("Consider additional authentication");
            recs.push_back("Monitor for related suspicious activity");
            break;
        case RiskTier::Safe:
            recs.push_back("APPROVE transaction");
            if (factor_names.empty()) {
                recs.push_back("Process normally");
            } else {
                recs.push_back("Monitor account for 24 hours");
                recs.push_back("Update customer risk profile");
            }
            break;
    }
    
    return recs;
}
