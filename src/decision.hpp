#pragma once

#include <string>
#include <vector>

enum class RiskTier {
    Safe,
    Suspicious,
    Fraud
};

std::string risk_tier_string(RiskTier tier);

struct DecisionConfig {
    double threshold = 0.5;
    double tier_low = 0.30;
    double tier_high = 0.70;
    
    // Throws std::invalid_argument unless 0 <= tier_low < tier_high <= 1
    // and the threshold lies in [0,1]
    void validate() const;
};

struct Decision {
    bool binary = false;
    RiskTier tier = RiskTier::Safe;
    double confidence = 0.0;
};

// SAFE below tier_low, FRAUD at or above tier_high
RiskTier classify(double p, double tier_low, double tier_high);

// Distance from 0.5 scaled to [0,1]
double decision_confidence(double p);

Decision decide(double p_cal, const DecisionConfig& config);

enum class RiskLevel {
    VeryLow,
    Low,
    Medium,
    High,
    Critical
};

std::string risk_level_string(RiskLevel level);
RiskLevel risk_level(double p);

// Reviewer actions for a decided tier; `factor_names` refine the FRAUD advice
std::vector<std::string> recommendations(RiskTier tier, const std::vector<std::string>& factor_names);
