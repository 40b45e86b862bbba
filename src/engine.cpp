#include "engine.hpp"
#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

DecisionConfig effective_decision(const ModelBundle& bundle, const EngineOptions& options) {
    DecisionConfig d = bundle.decision();
    if (options.tier_low) d.tier_low = *options.tier_low;
    if (options.tier_high) d.tier_high = *options.tier_high;
    d.validate();
    return d;
}

ExplainOptions explain_options(const EngineOptions& options) {
    ExplainOptions e;
    e.top_features = options.top_features;
    e.timeout_ms = options.explain_timeout_ms;
    return e;
}

const ModelBundle& require_bundle(const std::shared_ptr<const ModelBundle>& bundle) {
    if (!bundle) {
        throw std::invalid_argument("inference engine needs a bundle");
    }
    return *bundle;
}

} // namespace

EngineOptions EngineOptions::from_config(const Config& config) {
    EngineOptions o;
    o.min_quorum = config.min_quorum;
    o.schema_mode = schema_mode_from_string(config.schema_mode);
    o.tier_low = config.tier_low_override;
    o.tier_high = config.tier_high_override;
    o.worker_threads = config.worker_threads;
    o.explain_workers = config.explain_workers;
    o.request_timeout_ms = config.request_timeout_ms;
    o.explain_timeout_ms = config.explain_timeout_ms;
    o.top_features = config.top_features;
    o.ood_z_threshold = config.ood_z_threshold;
    return o;
}

InferenceEngine::InferenceEngine(std::shared_ptr<const ModelBundle> bundle, EngineOptions options,
                                 std::shared_ptr<PredictionTracker> tracker)
    : bundle_(std::move(bundle))
    , options_(options)
    , decision_(effective_decision(require_bundle(bundle_), options_))
    , validator_(bundle_->schema(), options_.schema_mode)
    , explainer_(bundle_, decision_, explain_options(options_))
    , tracker_(std::move(tracker))
{
    const int models = static_cast<int>(bundle_->registry().size());
    if (options_.min_quorum < 1 || options_.min_quorum > models) {
        throw std::invalid_argument("min quorum " + std::to_string(options_.min_quorum) +
                                    " must be between 1 and " + std::to_string(models));
    }
    if (options_.request_timeout_ms <= 0 || options_.explain_timeout_ms <= 0) {
        throw std::invalid_argument("timeouts must be positive");
    }
    if (options_.top_features < 1) {
        throw std::invalid_argument("top_features must be at least 1");
    }
    
    if (options_.worker_threads > 0) {
        score_pool_ = std::make_unique<WorkerPool>("score", options_.worker_threads);
    }
    if (options_.explain_workers > 0) {
        explain_pool_ = std::make_unique<WorkerPool>("explain", options_.explain_workers);
    }
    
    spdlog::info("Inference engine ready: bundle={} quorum={}/{} bands={:.2f}/{:.2f} threshold={:.3f}",
                 bundle_->version(), options_.min_quorum, models,
                 decision_.tier_low, decision_.tier_high, decision_.threshold);
}

InferenceEngine::~InferenceEngine() {
    shutdown();
}

void InferenceEngine::shutdown() {
    stopped_ = true;
    if (score_pool_) score_pool_->stop();
    if (explain_pool_) explain_pool_->stop();
}

HealthStatus InferenceEngine::health() const {
    HealthStatus h;
    h.ready = !stopped_ && (!score_pool_ || score_pool_->running());
    h.ml_count = bundle_->ml_count();
    h.dl_count = bundle_->dl_count();
    h.meta_learner_present = true;
    h.explainer_ready = !stopped_ && (!explain_pool_ || explain_pool_->running());
    h.bundle_version = bundle_->version();
    return h;
}

EngineInfo InferenceEngine::info() const {
    EngineInfo info;
    info.bundle_version = bundle_->version();
    info.feature_schema_version = bundle_->schema().version();
    info.decision = decision_;
    info.models = bundle_->registry().models();
    info.features = bundle_->schema().names();
    info.calibration = calibration_method_string(bundle_->calibrator().method());
    info.meta_kind = meta_kind_string(bundle_->meta().kind());
    info.min_quorum = options_.min_quorum;
    info.schema_mode = options_.schema_mode;
    return info;
}

void InferenceEngine::record_failure(ErrorKind kind) const {
    if (tracker_) tracker_->record_failure(kind);
}

EnsembleResult InferenceEngine::run(const FeatureVector& fv, util::Clock::time_point start,
                                    ScoredRequest* scored) const {
    auto deadline = start + std::chrono::milliseconds(options_.request_timeout_ms);
    const auto& registry = bundle_->registry();
    
    auto views = std::make_shared<const ScaledViews>(
        bundle_->scaling().apply(fv, registry.required_variants()));
    
    std::vector<BaseScore> scores = registry.score_all(views, score_pool_.get(), deadline,
                                                       options_.request_timeout_ms);
    
    EnsembleResult r;
    std::vector<std::string> failed;
    for (const auto& s : scores) {
        if (!s.available) {
            failed.push_back(s.model);
            continue;
        }
        if (s.family == ModelFamily::ML) {
            ++r.ml_used;
        } else {
            ++r.dl_used;
        }
    }
    
    int succeeded = r.ml_used + r.dl_used;
    if (succeeded < options_.min_quorum) {
        spdlog::error("Quorum not met: {}/{} models succeeded (need {}); failed: {}",
                      succeeded, scores.size(), options_.min_quorum, util::join(failed, ", "));
        throw QuorumNotMet(succeeded, options_.min_quorum, failed);
    }
    
    FusionVector fusion = bundle_->meta().assemble(scores);
    for (size_t i = 0; i < fusion.imputed.size(); ++i) {
        if (fusion.imputed[i]) r.imputed.push_back(scores[i].model);
    }
    
    r.p_raw = bundle_->meta().predict(fusion);
    r.p_cal = bundle_->calibrator().apply(r.p_raw);
    
    Decision d = decide(r.p_cal, decision_);
    r.threshold = decision_.threshold;
    r.binary = d.binary;
    r.tier = d.tier;
    r.confidence = d.confidence;
    
    r.unavailable = failed;
    r.bundle_version = bundle_->version();
    r.ood_warnings = out_of_distribution(fv, bundle_->schema(), bundle_->scaling().standard(),
                                         options_.ood_z_threshold);
    r.timestamp = util::current_iso8601();
    
    if (scored) {
        scored->views = views;
        scored->base_scores = scores;
        scored->fusion = fusion;
        scored->p_cal = r.p_cal;
        scored->tier = r.tier;
    }
    r.base_scores = std::move(scores);
    r.elapsed_ms = util::elapsed_ms(start);
    
    if (tracker_) {
        tracker_->record_prediction(r.base_scores, r.tier, r.p_cal);
    }
    
    spdlog::debug("Scored: p_raw={:.4f} p_cal={:.4f} tier={} models={}+{} in {:.1f}ms",
                  r.p_raw, r.p_cal, risk_tier_string(r.tier), r.ml_used, r.dl_used, r.elapsed_ms);
    return r;
}

EnsembleResult InferenceEngine::score(const FeatureVector& fv) const {
    if (fv.values.size() != bundle_->schema().size()) {
        throw std::invalid_argument("feature vector has " + std::to_string(fv.values.size()) +
                                    " values, schema has " + std::to_string(bundle_->schema().size()));
    }
    try {
        return run(fv, util::Clock::now(), nullptr);
    } catch (const EngineError& e) {
        record_failure(e.kind());
        throw;
    }
}

EnsembleResult InferenceEngine::predict(const nlohmann::json& raw) const {
    auto start = util::Clock::now();
    try {
        FeatureVector fv = validator_.validate(raw);
        return run(fv, start, nullptr);
    } catch (const EngineError& e) {
        record_failure(e.kind());
        throw;
    }
}

ExplainResult InferenceEngine::explain(const nlohmann::json& raw) const {
    auto start = util::Clock::now();
    ExplainResult out;
    ScoredRequest scored;
    
    try {
        FeatureVector fv = validator_.validate(raw);
        out.result = run(fv, start, &scored);
    } catch (const EngineError& e) {
        record_failure(e.kind());
        throw;
    }
    
    out.explanation = explainer_.explain(scored, explain_pool_.get());
    spdlog::debug("Explained in {:.1f}ms (complete={})", util::elapsed_ms(start),
                  out.explanation.complete);
    return out;
}

std::vector<BatchItem> InferenceEngine::predict_batch(const std::vector<nlohmann::json>& items) const {
    std::vector<BatchItem> out;
    out.reserve(items.size());
    
    for (size_t i = 0; i < items.size(); ++i) {
        BatchItem item;
        item.index = i;
        try {
            item.result = predict(items[i]);
            item.ok = true;
        } catch (const SchemaViolation& e) {
            item.error_kind = e.kind();
            item.message = e.what();
            item.missing = e.missing();
            item.extra = e.extra();
            item.non_numeric = e.non_numeric();
            spdlog::warn("Batch item {} rejected: {}", i, e.what());
        } catch (const EngineError& e) {
            item.error_kind = e.kind();
            item.message = e.what();
            spdlog::warn("Batch item {} failed: {}", i, e.what());
        } catch (const std::exception& e) {
            item.error_kind = ErrorKind::Internal;
            item.message = e.what();
            record_failure(ErrorKind::Internal);
            spdlog::error("Batch item {} internal error: {}", i, e.what());
        }
        out.push_back(std::move(item));
    }
    
    return out;
}
