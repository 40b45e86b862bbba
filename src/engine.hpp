#pragma once

#include "bundle.hpp"
#include "drift.hpp"
#include "errors.hpp"
#include "explainer.hpp"
#include "feature_schema.hpp"
#include "prediction_tracker.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct Config;

struct EngineOptions {
    int min_quorum = 10;
    SchemaMode schema_mode = SchemaMode::Strict;
    std::optional<double> tier_low;
    std::optional<double> tier_high;
    int worker_threads = 4;       // 0 scores inline on the calling thread
    int explain_workers = 2;      // 0 explains inline
    int request_timeout_ms = 2000;
    int explain_timeout_ms = 5000;
    int top_features = 10;
    double ood_z_threshold = 4.0;
    
    static EngineOptions from_config(const Config& config);
};

struct EnsembleResult {
    double p_raw = 0.0;
    double p_cal = 0.0;
    double threshold = 0.0;
    bool binary = false;
    RiskTier tier = RiskTier::Safe;
    double confidence = 0.0;
    double elapsed_ms = 0.0;
    
    // Model usage
    int ml_used = 0;
    int dl_used = 0;
    std::vector<std::string> unavailable;
    std::vector<std::string> imputed;
    std::vector<BaseScore> base_scores;
    
    std::string bundle_version;
    std::vector<OodWarning> ood_warnings;
    std::string timestamp;
};

struct ExplainResult {
    EnsembleResult result;
    Explanation explanation;
};

// One batch entry; on failure `result` is left default and the error fields are set
struct BatchItem {
    size_t index = 0;
    bool ok = false;
    EnsembleResult result;
    ErrorKind error_kind = ErrorKind::Internal;
    std::string message;
    std::vector<std::string> missing;
    std::vector<std::string> extra;
    std::vector<std::string> non_numeric;
};

struct HealthStatus {
    bool ready = false;              // false once the engine is shut down
    size_t ml_count = 0;
    size_t dl_count = 0;
    bool meta_learner_present = false;   // a loaded bundle always carries one sized to its registry
    bool explainer_ready = false;
    std::string bundle_version;
};

struct EngineInfo {
    std::string bundle_version;
    std::string feature_schema_version;
    DecisionConfig decision;
    std::vector<ModelDescriptor> models;
    std::vector<std::string> features;
    std::string calibration;
    std::string meta_kind;
    int min_quorum = 0;
    SchemaMode schema_mode = SchemaMode::Strict;
};

class InferenceEngine {
public:
    // Throws std::invalid_argument when the options do not fit the bundle
    InferenceEngine(std::shared_ptr<const ModelBundle> bundle, EngineOptions options,
                    std::shared_ptr<PredictionTracker> tracker = nullptr);
    ~InferenceEngine();
    
    HealthStatus health() const;
    EngineInfo info() const;
    
    // Validates a raw feature object, then scores it
    EnsembleResult predict(const nlohmann::json& raw) const;
    
    // Scores an already validated vector
    EnsembleResult score(const FeatureVector& fv) const;
    
    ExplainResult explain(const nlohmann::json& raw) const;
    
    // Items are independent; per-item failures never fail the batch
    std::vector<BatchItem> predict_batch(const std::vector<nlohmann::json>& items) const;
    
    void shutdown();
    
    const ModelBundle& bundle() const { return *bundle_; }
    const DecisionConfig& decision() const { return decision_; }
    const EngineOptions& options() const { return options_; }
    
private:
    std::shared_ptr<const ModelBundle> bundle_;
    EngineOptions options_;
    DecisionConfig decision_;
    FeatureValidator validator_;
    Explainer explainer_;
    std::shared_ptr<PredictionTracker> tracker_;
    std::unique_ptr<WorkerPool> score_pool_;
    std::unique_ptr<WorkerPool> explain_pool_;
    std::atomic<bool> stopped_{false};
    
    EnsembleResult run(const FeatureVector& fv, util::Clock::time_point start,
                       ScoredRequest* scored) const;
    void record_failure(ErrorKind kind) const;
};
