#include "explainer.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <future>

std::string attribution_status_string(AttributionStatus status) {
    switch (status) {
        case AttributionStatus::Computed: return "computed";
        case AttributionStatus::Unsupported: return "unsupported";
        case AttributionStatus::SkippedTimeout: return "skipped_timeout";
        case AttributionStatus::Failed: return "failed";
        case AttributionStatus::ModelUnavailable: return "model_unavailable";
    }
    return "unsupported";
}

Explainer::Explainer(std::shared_ptr<const ModelBundle> bundle, DecisionConfig decision,
                     ExplainOptions options)
    : bundle_(std::move(bundle)), decision_(decision), options_(options)
{
    if (!bundle_) {
        throw std::invalid_argument("explainer needs a bundle");
    }
}

std::vector<double> Explainer::attribute(const ModelDescriptor& model, const ScaledViews& views,
                                         const ScaledViews& baseline) {
    const auto& x = views.view(model.scaling);
    switch (model.attribution) {
        case AttributionMethod::Native:
            return model.scorer->native_attribution(x);
        case AttributionMethod::Occlusion:
            return occlusion_attribution(*model.scorer, x, baseline.view(model.scaling));
        case AttributionMethod::None:
            break;
    }
    throw std::logic_error("model " + model.name + " has no attribution method");
}

std::vector<double> Explainer::contribution_weights(const MetaLearner& meta, const FusionVector& fv) {
    std::vector<double> terms = meta.contributions(fv);
    double total = 0.0;
    for (double t : terms) total += std::fabs(t);
    
    if (total <= 0.0) {
        return std::vector<double>(terms.size(), 0.0);
    }
    for (auto& t : terms) t /= total;
    return terms;
}

std::vector<FeatureImpact> Explainer::top_impacts(const std::vector<double>& attribution,
                                                  const std::vector<double>& raw) const {
    const auto& names = bundle_->schema().names();
    std::vector<FeatureImpact> impacts;
    for (size_t i = 0; i < attribution.size(); ++i) {
        if (attribution[i] == 0.0) continue;
        impacts.push_back({names[i], raw[i], attribution[i]});
    }
    
    std::sort(impacts.begin(), impacts.end(), [](const FeatureImpact& a, const FeatureImpact& b) {
        return a.magnitude() > b.magnitude();
    });
    if (impacts.size() > static_cast<size_t>(options_.top_features)) {
        impacts.resize(options_.top_features);
    }
    return impacts;
}

Explanation Explainer::explain(const ScoredRequest& request, WorkerPool* pool) const {
    const auto& registry = bundle_->registry();
    const auto& models = registry.models();
    const auto& raw = request.views->raw;
    auto deadline = util::Clock::now() + std::chrono::milliseconds(options_.timeout_ms);
    
    Explanation ex;
    std::vector<double> weights = contribution_weights(bundle_->meta(), request.fusion);
    
    // Per-model breakdown; attribution tasks only for models that can have one
    std::vector<std::future<std::vector<double>>> futures(models.size());
    std::vector<bool> pending(models.size(), false);
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    ex.models.resize(models.size());
    
    for (size_t i = 0; i < models.size(); ++i) {
        const auto& md = models[i];
        const auto& bs = request.base_scores[i];
        ModelExplanation& me = ex.models[i];
        me.model = md.name;
        me.display_name = md.display_name;
        me.family = md.family;
        me.available = bs.available;
        me.probability = bs.probability;
        me.tier = classify(bs.probability, decision_.tier_low, decision_.tier_high);
        me.contribution_weight = weights[i];
        me.method = md.attribution;
        
        if (!bs.available) {
            me.status = AttributionStatus::ModelUnavailable;
            me.error = bs.error;
            continue;
        }
        if (md.attribution == AttributionMethod::None) {
            me.status = AttributionStatus::Unsupported;
            continue;
        }
        
        pending[i] = true;
        if (pool) {
            auto views = request.views;
            auto bundle = bundle_;
            futures[i] = pool->submit([md, views, bundle, cancelled]() {
                if (cancelled->load()) {
                    return std::vector<double>();
                }
                return attribute(md, *views, bundle->occlusion_baseline());
            });
        }
    }
    
    std::vector<double> global(raw.size(), 0.0);
    
    for (size_t i = 0; i < models.size(); ++i) {
        if (!pending[i]) continue;
        ModelExplanation& me = ex.models[i];
        std::vector<double> attribution;
        
        try {
            if (pool) {
                if (futures[i].wait_until(deadline) != std::future_status::ready) {
                    me.status = AttributionStatus::SkippedTimeout;
                    ex.skipped.push_back(me.model);
                    continue;
                }
                attribution = futures[i].get();
            } else {
                if (util::Clock::now() > deadline) {
                    me.status = AttributionStatus::SkippedTimeout;
                    ex.skipped.push_back(me.model);
                    continue;
                }
                attribution = attribute(models[i], *request.views, bundle_->occlusion_baseline());
            }
        } catch (const std::exception& e) {
            spdlog::warn("Attribution failed for model {}: {}", me.model, e.what());
            me.status = AttributionStatus::Failed;
            me.error = e.what();
            ex.failed.push_back(me.model);
            continue;
        }
        
        me.status = AttributionStatus::Computed;
        me.top_features = top_impacts(attribution, raw);
        
        double l1 = 0.0;
        for (double a : attribution) l1 += std::fabs(a);
        if (l1 <= 0.0) continue;
        for (size_t f = 0; f < global.size(); ++f) {
            global[f] += me.contribution_weight * attribution[f] / l1;
        }
    }
    
    // Attributions still queued belong to an answered request
    cancelled->store(true);
    
    ex.complete = ex.skipped.empty() && ex.failed.empty();
    if (!ex.complete) {
        spdlog::warn("Explanation incomplete after {}ms; skipped [{}] failed [{}]", options_.timeout_ms,
                     util::join(ex.skipped, ", "), util::join(ex.failed, ", "));
    }
    
    std::stable_sort(ex.models.begin(), ex.models.end(),
                     [](const ModelExplanation& a, const ModelExplanation& b) {
                         return std::fabs(a.contribution_weight) > std::fabs(b.contribution_weight);
                     });
    
    // Global attribution, top K by magnitude
    const auto& names = bundle_->schema().names();
    for (size_t f = 0; f < global.size(); ++f) {
        if (global[f] == 0.0) continue;
        ex.global_features.push_back({names[f], raw[f], global[f]});
    }
    std::sort(ex.global_features.begin(), ex.global_features.end(),
              [](const GlobalFeature& a, const GlobalFeature& b) {
                  return std::fabs(a.contribution) > std::fabs(b.contribution);
              });
    if (ex.global_features.size() > static_cast<size_t>(options_.top_features)) {
        ex.global_features.resize(options_.top_features);
    }
    
    ex.consensus = consensus_summary(request.base_scores, request.tier, decision_);
    ex.risk_factors = derive_risk_factors(ex.global_features, request.p_cal, ex.consensus,
                                          *bundle_, decision_);
    ex.risk_level = risk_level(request.p_cal);
    
    std::vector<std::string> factor_names;
    for (const auto& rf : ex.risk_factors) factor_names.push_back(rf.factor);
    ex.recommendations = recommendations(request.tier, factor_names);
    ex.summary = summarize(ex, request.p_cal, request.tier);
    
    return ex;
}

std::string Explainer::summarize(const Explanation& ex, double p_cal, RiskTier tier) const {
    std::string text;
    
    if (tier == RiskTier::Fraud) {
        text = fmt::format("This transaction was flagged as FRAUDULENT with a {:.1f}% fraud probability. ",
                           p_cal * 100.0);
        if (!ex.risk_factors.empty()) {
            std::vector<std::string> concerns;
            for (size_t i = 0; i < ex.risk_factors.size() && i < 3; ++i) {
                concerns.push_back(ex.risk_factors[i].factor);
            }
            text += "Key concerns identified: " + util::join(concerns, ", ") + ". ";
        } else {
            text += "Multiple suspicious patterns detected by the ensemble. ";
        }
        
        std::vector<std::string> drivers;
        for (size_t i = 0; i < ex.global_features.size() && drivers.size() < 3; ++i) {
            if (ex.global_features[i].increases_risk()) drivers.push_back(ex.global_features[i].feature);
        }
        if (!drivers.empty()) {
            text += "Primary risk indicators: " + util::join(drivers, ", ") + ".";
        }
    } else if (tier == RiskTier::Safe) {
        text = fmt::format("This transaction appears LEGITIMATE with a {:.1f}% fraud probability. ",
                           p_cal * 100.0);
        size_t feature_factors = 0;
        for (const auto& rf : ex.risk_factors) {
            if (!rf.feature.empty()) ++feature_factors;
        }
        if (feature_factors > 0) {
            text += fmt::format("Although {} minor risk factors were detected, they are within "
                                "acceptable limits for normal transactions. ", feature_factors);
        } else {
            text += "No significant risk patterns were identified. ";
        }
        
        std::vector<std::string> protective;
        for (size_t i = 0; i < ex.global_features.size() && protective.size() < 3; ++i) {
            if (ex.global_features[i].contribution < -0.05) protective.push_back(ex.global_features[i].feature);
        }
        if (!protective.empty()) {
            text += "Strong legitimacy indicators: " + util::join(protective, ", ") + ".";
        }
    } else {
        text = fmt::format("Transaction classification: SUSPICIOUS with a {:.1f}% fraud probability. "
                           "Please review manually for a final decision.", p_cal * 100.0);
    }
    
    if (!ex.complete) {
        text += " Attribution is partial:";
        if (!ex.skipped.empty()) {
            text += fmt::format(" {} model(s) timed out.", ex.skipped.size());
        }
        if (!ex.failed.empty()) {
            text += fmt::format(" {} model(s) failed.", ex.failed.size());
        }
    }
    
    // Trailing space left by the fixed sentences
    while (!text.empty() && text.back() == ' ') text.pop_back();
    return text;
}
