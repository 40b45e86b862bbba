#pragma once

#include "decision.hpp"
#include "feature_schema.hpp"
#include "fusion.hpp"
#include "model_registry.hpp"
#include "scaling.hpp"
#include <map>
#include <memory>
#include <string>

// Attribution share cut points for risk factor severity
struct RiskCuts {
    double low = 0.03;
    double medium = 0.08;
    double high = 0.15;
};

// Business text for an engineered feature; "{value}" is replaced by the input value
struct FeatureSemantic {
    std::string factor;
    std::string description;
};

// Immutable once constructed; shared across requests as shared_ptr<const ModelBundle>
class ModelBundle {
public:
    // Cross-checks every dimension and throws std::invalid_argument on mismatch
    ModelBundle(std::string version, FeatureSchema schema, ScalingPolicy scaling,
                ModelRegistry registry, MetaLearner meta, Calibrator calibrator,
                DecisionConfig decision, RiskCuts risk_cuts = RiskCuts(),
                std::map<std::string, FeatureSemantic> semantics = {});
    
    const std::string& version() const { return version_; }
    const FeatureSchema& schema() const { return schema_; }
    const ScalingPolicy& scaling() const { return scaling_; }
    const ModelRegistry& registry() const { return registry_; }
    const MetaLearner& meta() const { return meta_; }
    const Calibrator& calibrator() const { return calibrator_; }
    const DecisionConfig& decision() const { return decision_; }
    const RiskCuts& risk_cuts() const { return risk_cuts_; }
    const std::map<std::string, FeatureSemantic>& semantics() const { return semantics_; }
    
    // Reference point for occlusion: the standard scaler mean (zeros
    // without one), in every scaling variant the registry needs
    const ScaledViews& occlusion_baseline() const { return baseline_; }
    
    size_t ml_count() const;
    size_t dl_count() const;
    
private:
    std::string version_;
    FeatureSchema schema_;
    ScalingPolicy scaling_;
    ModelRegistry registry_;
    MetaLearner meta_;
    Calibrator calibrator_;
    DecisionConfig decision_;
    RiskCuts risk_cuts_;
    std::map<std::string, FeatureSemantic> semantics_;
    ScaledViews baseline_;
};

class BundleLoader {
public:
    // Reads <dir>/manifest.json and every model artifact it names. Any
    // missing, corrupt or inconsistent piece throws BundleLoadError.
    static std::shared_ptr<const ModelBundle> load(const std::string& dir);
    
    // Builds a bundle from an already-parsed manifest; artifact paths are
    // resolved against `dir`
    static std::shared_ptr<const ModelBundle> from_manifest(const nlohmann::json& manifest,
                                                            const std::string& dir);
    
    // Adapter for one model artifact, chosen by its "type"
    static std::shared_ptr<const Scorer> make_scorer(const nlohmann::json& artifact);
    
    // Default per family: native for linear and tree models, occlusion for
    // flat nets and autoencoders, none for sequence nets
    static AttributionMethod default_attribution(const nlohmann::json& artifact);
};
