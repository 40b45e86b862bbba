#pragma once

#include "bundle.hpp"
#include "risk_factors.hpp"
#include "util.hpp"
#include <memory>
#include <string>
#include <vector>

class WorkerPool;

enum class AttributionStatus {
    Computed,
    Unsupported,
    SkippedTimeout,
    Failed,
    ModelUnavailable
};

std::string attribution_status_string(AttributionStatus status);

struct FeatureImpact {
    std::string feature;
    double value = 0.0;    // raw input value
    double impact = 0.0;   // signed, in the model's output space
    
    bool increases_risk() const { return impact > 0.0; }
    double magnitude() const { return impact < 0.0 ? -impact : impact; }
};

struct ModelExplanation {
    std::string model;
    std::string display_name;
    ModelFamily family = ModelFamily::ML;
    bool available = false;
    double probability = 0.0;
    RiskTier tier = RiskTier::Safe;
    double contribution_weight = 0.0;   // c_m*s_m / sum |c_k*s_k|
    AttributionMethod method = AttributionMethod::None;
    AttributionStatus status = AttributionStatus::Unsupported;
    std::string error;
    std::vector<FeatureImpact> top_features;
};

struct Explanation {
    std::vector<ModelExplanation> models;           // ranked by |contribution_weight|
    std::vector<GlobalFeature> global_features;     // ranked by |contribution|
    std::vector<RiskFactor> risk_factors;
    ConsensusSummary consensus;
    RiskLevel risk_level = RiskLevel::VeryLow;
    std::vector<std::string> recommendations;
    std::string summary;
    bool complete = true;
    std::vector<std::string> skipped;               // models whose attribution timed out
    std::vector<std::string> failed;                // models whose attribution threw
};

// What the explainer needs from a scored request
struct ScoredRequest {
    std::shared_ptr<const ScaledViews> views;
    std::vector<BaseScore> base_scores;
    FusionVector fusion;
    double p_cal = 0.0;
    RiskTier tier = RiskTier::Safe;
};

struct ExplainOptions {
    int top_features = 10;
    int timeout_ms = 5000;
};

class Explainer {
public:
    Explainer(std::shared_ptr<const ModelBundle> bundle, DecisionConfig decision,
              ExplainOptions options);
    
    // Attributions run on `pool` when given. Whatever has not finished by
    // the explain deadline is reported as skipped, attributions that throw
    // are reported as failed, and either makes `complete` false.
    Explanation explain(const ScoredRequest& request, WorkerPool* pool) const;
    
    // Signed per-feature attribution for one model, in schema order
    static std::vector<double> attribute(const ModelDescriptor& model, const ScaledViews& views,
                                         const ScaledViews& baseline);
    
    // c_m*s_m normalised by the sum of magnitudes; zeros when every term is zero
    static std::vector<double> contribution_weights(const MetaLearner& meta, const FusionVector& fv);
    
private:
    std::shared_ptr<const ModelBundle> bundle_;
    DecisionConfig decision_;
    ExplainOptions options_;
    
    std::vector<FeatureImpact> top_impacts(const std::vector<double>& attribution,
                                           const std::vector<double>& raw) const;
    std::string summarize(const Explanation& ex, double p_cal, RiskTier tier) const;
};
