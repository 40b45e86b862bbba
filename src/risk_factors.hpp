#pragma once

#include "bundle.hpp"
#include "decision.hpp"
#include "model_registry.hpp"
#include <string>
#include <vector>

// One entry of the fused, ranked feature attribution
struct GlobalFeature {
    std::string feature;
    double value = 0.0;          // raw input value
    double contribution = 0.0;   // signed, weighted share of the fused decision
    
    bool increases_risk() const { return contribution > 0.0; }
};

struct RiskFactor {
    std::string factor;
    std::string severity;   // "low", "medium" or "high"
    std::string description;
    std::string feature;    // empty for ensemble-level factors
};

struct ConsensusSummary {
    int fraud = 0;
    int suspicious = 0;
    int safe = 0;
    int unavailable = 0;
    double agreement_ratio = 0.0;   // available models sharing the ensemble tier
    double min_score = 0.0;
    double max_score = 0.0;
    double std_dev = 0.0;
};

// Empty when the share is below the low cut
std::string severity_for(double share, const RiskCuts& cuts);

// Each base model is tiered on its own under the same bands as the ensemble
ConsensusSummary consensus_summary(const std::vector<BaseScore>& scores, RiskTier ensemble_tier,
                                   const DecisionConfig& decision);

bool models_disagree(const ConsensusSummary& consensus);

// Replaces every "{value}" in `text`
std::string render_semantic_text(const std::string& text, double value);

std::vector<RiskFactor> derive_risk_factors(const std::vector<GlobalFeature>& global,
                                            double p_cal,
                                            const ConsensusSummary& consensus,
                                            const ModelBundle& bundle,
                                            const DecisionConfig& decision);
