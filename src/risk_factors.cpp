#include "risk_factors.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

std::string severity_for(double share, const RiskCuts& cuts) {
    if (share >= cuts.high) return "high";
    if (share >= cuts.medium) return "medium";
    if (share >= cuts.low) return "low";
    return "";
}

ConsensusSummary consensus_summary(const std::vector<BaseScore>& scores, RiskTier ensemble_tier,
                                   const DecisionConfig& decision) {
    ConsensusSummary c;
    std::vector<double> values;
    int agreeing = 0;
    
    for (const auto& s : scores) {
        if (!s.available) {
            ++c.unavailable;
            continue;
        }
        values.push_back(s.probability);
        RiskTier tier = classify(s.probability, decision.tier_low, decision.tier_high);
        switch (tier) {
            case RiskTier::Fraud: ++c.fraud; break;
            case RiskTier::Suspicious: ++c.suspicious; break;
            case RiskTier::Safe: ++c.safe; break;
        }
        if (tier == ensemble_tier) ++agreeing;
    }
    
    if (values.empty()) {
        return c;
    }
    
    auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    c.min_score = *lo;
    c.max_score = *hi;
    
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= static_cast<double>(values.size());
    double var = 0.0;
    for (double v : values) var += (v - mean) * (v - mean);
    c.std_dev = std::sqrt(var / static_cast<double>(values.size()));
    
    c.agreement_ratio = static_cast<double>(agreeing) / static_cast<double>(values.size());
    return c;
}

bool models_disagree(const ConsensusSummary& consensus) {
    return consensus.fraud > 0 && consensus.safe > 0 && consensus.agreement_ratio < 0.6;
}

std::string render_semantic_text(const std::string& text, double value) {
    static const std::string placeholder = "{value}";
    std::string rendered = fmt::format("{:.2f}", value);
    
    std::string out = text;
    size_t pos = 0;
    while ((pos = out.find(placeholder, pos)) != std::string::npos) {
        out.replace(pos, placeholder.size(), rendered);
        pos += rendered.size();
    }
    return out;
}

std::vector<RiskFactor> derive_risk_factors(const std::vector<GlobalFeature>& global,
                                            double p_cal,
                                            const ConsensusSummary& consensus,
                                            const ModelBundle& bundle,
                                            const DecisionConfig& decision) {
    std::vector<RiskFactor> factors;
    
    if (p_cal >= 0.9) {
        factors.push_back({"Extremely High Fraud Risk", "high",
                           fmt::format("Ensemble fraud probability is {:.1f}%", p_cal * 100.0), ""});
    } else if (p_cal >= decision.tier_high) {
        factors.push_back({"High Fraud Risk", "high",
                           fmt::format("Ensemble fraud probability is {:.1f}%", p_cal * 100.0), ""});
    } else if (p_cal >= 0.5) {
        factors.push_back({"Moderate Risk Detected", "medium",
                           fmt::format("Ensemble fraud probability is {:.1f}%", p_cal * 100.0), ""});
    }
    
    for (const auto& g : global) {
        if (!g.increases_risk()) continue;
        std::string severity = severity_for(g.contribution, bundle.risk_cuts());
        if (severity.empty()) continue;
        
        RiskFactor rf;
        rf.feature = g.feature;
        rf.severity = severity;
        
        auto it = bundle.semantics().find(g.feature);
        if (it != bundle.semantics().end()) {
            rf.factor = render_semantic_text(it->second.factor, g.value);
            rf.description = render_semantic_text(it->second.description, g.value);
        } else {
            rf.factor = fmt::format("Elevated {}", g.feature);
            rf.description = fmt::format("{} = {:.4g} raises fraud risk ({:.1f}% of the decision)",
                                         g.feature, g.value, g.contribution * 100.0);
        }
        factors.push_back(std::move(rf));
    }
    
    if (models_disagree(consensus)) {
        factors.push_back({"Model Disagreement", "medium",
                           fmt::format("{} models say FRAUD while {} say SAFE (score spread {:.2f} to {:.2f})",
                                       consensus.fraud, consensus.safe,
                                       consensus.min_score, consensus.max_score), ""});
    }
    
    return factors;
}
