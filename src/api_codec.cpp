#include "api_codec.hpp"

void to_json(nlohmann::json& j, const BaseScore& s) {
    j = {
        {"model", s.model},
        {"display_name", s.display_name},
        {"family", model_family_string(s.family)},
        {"algorithm", s.algorithm},
        {"available", s.available},
        {"latency_ms", s.latency_ms}
    };
    if (s.available) {
        j["probability"] = s.probability;
    } else {
        j["probability"] = nullptr;
        j["error"] = s.error;
    }
}

void to_json(nlohmann::json& j, const OodWarning& w) {
    j = {{"feature", w.feature}, {"value", w.value}, {"z_score", w.z_score}};
}

void to_json(nlohmann::json& j, const EnsembleResult& r) {
    j = {
        {"p_raw", r.p_raw},
        {"p_cal", r.p_cal},
        {"probability", r.p_cal},
        {"threshold", r.threshold},
        {"binary_decision", r.binary},
        {"is_fraud", r.binary},
        {"classification", risk_tier_string(r.tier)},
        {"confidence", r.confidence},
        {"elapsed_ms", r.elapsed_ms},
        {"model_usage", {
            {"ml_models_used", r.ml_used},
            {"dl_models_used", r.dl_used},
            {"total_models_used", r.ml_used + r.dl_used},
            {"unavailable", r.unavailable},
            {"imputed", r.imputed}
        }},
        {"base_scores", r.base_scores},
        {"bundle_version", r.bundle_version},
        {"ood_warnings", r.ood_warnings},
        {"timestamp", r.timestamp}
    };
}

void to_json(nlohmann::json& j, const FeatureImpact& f) {
    j = {
        {"feature", f.feature},
        {"value", f.value},
        {"impact", f.impact},
        {"direction", f.increases_risk() ? "increases_risk" : "decreases_risk"},
        {"magnitude", f.magnitude()}
    };
}

void to_json(nlohmann::json& j, const ModelExplanation& m) {
    j = {
        {"model", m.model},
        {"display_name", m.display_name},
        {"family", model_family_string(m.family)},
        {"available", m.available},
        {"probability", m.available ? nlohmann::json(m.probability) : nlohmann::json(nullptr)},
        {"classification", m.available ? nlohmann::json(risk_tier_string(m.tier)) : nlohmann::json(nullptr)},
        {"contribution_weight", m.contribution_weight},
        {"attribution_method", attribution_method_string(m.method)},
        {"attribution_status", attribution_status_string(m.status)},
        {"top_features", m.top_features}
    };
    if (!m.error.empty()) {
        j["error"] = m.error;
    }
}

void to_json(nlohmann::json& j, const GlobalFeature& g) {
    j = {
        {"feature", g.feature},
        {"value", g.value},
        {"contribution", g.contribution},
        {"direction", g.increases_risk() ? "increases_risk" : "decreases_risk"}
    };
}

void to_json(nlohmann::json& j, const RiskFactor& rf) {
    j = {{"factor", rf.factor}, {"severity", rf.severity}, {"description", rf.description}};
    if (!rf.feature.empty()) {
        j["feature"] = rf.feature;
    }
}

void to_json(nlohmann::json& j, const ConsensusSummary& c) {
    j = {
        {"fraud", c.fraud},
        {"suspicious", c.suspicious},
        {"safe", c.safe},
        {"unavailable", c.unavailable},
        {"agreement_ratio", c.agreement_ratio},
        {"min_score", c.min_score},
        {"max_score", c.max_score},
        {"std_dev", c.std_dev}
    };
}

void to_json(nlohmann::json& j, const Explanation& e) {
    j = {
        {"model_contributions", e.models},
        {"feature_contributions", e.global_features},
        {"risk_factors", e.risk_factors},
        {"consensus", e.consensus},
        {"risk_level", risk_level_string(e.risk_level)},
        {"recommendations", e.recommendations},
        {"summary", e.summary},
        {"complete", e.complete},
        {"skipped", e.skipped},
        {"failed", e.failed}
    };
}

void to_json(nlohmann::json& j, const ExplainResult& r) {
    j = {{"prediction", r.result}, {"explanation", r.explanation}};
}

void to_json(nlohmann::json& j, const BatchItem& item) {
    j = {{"index", item.index}, {"ok", item.ok}};
    if (item.ok) {
        j["result"] = item.result;
        return;
    }
    
    nlohmann::json err = {
        {"error", error_kind_string(item.error_kind)},
        {"message", item.message}
    };
    if (item.error_kind == ErrorKind::SchemaViolation) {
        err["missing"] = item.missing;
        err["extra"] = item.extra;
        err["non_numeric"] = item.non_numeric;
    }
    j["error"] = err;
}

void to_json(nlohmann::json& j, const HealthStatus& h) {
    j = {
        {"status", h.ready ? "ok" : "unavailable"},
        {"models_loaded", {
            {"ml_count", h.ml_count},
            {"dl_count", h.dl_count},
            {"meta_learner_present", h.meta_learner_present},
            {"explainer_ready", h.explainer_ready}
        }},
        {"bundle_version", h.bundle_version}
    };
}

void to_json(nlohmann::json& j, const EngineInfo& info) {
    nlohmann::json models = nlohmann::json::array();
    for (const auto& m : info.models) {
        models.push_back({
            {"name", m.name},
            {"display_name", m.display_name},
            {"family", model_family_string(m.family)},
            {"algorithm", m.algorithm()},
            {"scaling", scaling_variant_string(m.scaling)},
            {"attribution", attribution_method_string(m.attribution)}
        });
    }
    
    j = {
        {"bundle_version", info.bundle_version},
        {"feature_schema_version", info.feature_schema_version},
        {"thresholds", {
            {"threshold", info.decision.threshold},
            {"tier_low", info.decision.tier_low},
            {"tier_high", info.decision.tier_high}
        }},
        {"models", models},
        {"model_count", info.models.size()},
        {"feature_count", info.features.size()},
        {"features", info.features},
        {"meta_learner", info.meta_kind},
        {"calibration", info.calibration},
        {"min_quorum", info.min_quorum},
        {"schema_mode", schema_mode_string(info.schema_mode)}
    };
}

nlohmann::json error_json(ErrorKind kind, const std::string& message) {
    return {{"error", error_kind_string(kind)}, {"message", message}};
}

nlohmann::json error_json(const EngineError& e) {
    nlohmann::json j = error_json(e.kind(), e.what());
    
    if (auto sv = dynamic_cast<const SchemaViolation*>(&e)) {
        j["missing"] = sv->missing();
        j["extra"] = sv->extra();
        j["non_numeric"] = sv->non_numeric();
    } else if (auto q = dynamic_cast<const QuorumNotMet*>(&e)) {
        j["succeeded"] = q->succeeded();
        j["required"] = q->required();
        j["failed_models"] = q->failed_models();
    } else if (auto t = dynamic_cast<const DownstreamTimeout*>(&e)) {
        j["stage"] = t->stage();
        j["budget_ms"] = t->budget_ms();
    }
    return j;
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SchemaViolation: return 400;
        case ErrorKind::QuorumNotMet: return 503;
        case ErrorKind::DownstreamTimeout: return 504;
        case ErrorKind::BundleLoad: return 503;
        case ErrorKind::Internal: return 500;
    }
    return 500;
}

std::vector<nlohmann::json> batch_items(const nlohmann::json& body) {
    const nlohmann::json* items = &body;
    if (body.is_object() && body.contains("transactions")) {
        items = &body.at("transactions");
    }
    if (!items->is_array()) {
        throw SchemaViolation({}, {}, {}, "batch body must be an array or {\"transactions\": [...]}");
    }
    return items->get<std::vector<nlohmann::json>>();
}
