#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "test_helpers.hpp"
#include "../src/explainer.hpp"
#include "../src/worker_pool.hpp"
#include <algorithm>
#include <cmath>

using Catch::Matchers::WithinAbs;

namespace {

ScoredRequest score_request(const ModelBundle& bundle, const std::vector<double>& raw, RiskTier tier) {
    FeatureVector fv{raw};
    auto views = std::make_shared<const ScaledViews>(
        bundle.scaling().apply(fv, bundle.registry().required_variants()));
    
    ScoredRequest req;
    req.views = views;
    req.base_scores = bundle.registry().score_all(views, nullptr,
                                                  util::Clock::now() + std::chrono::seconds(5), 5000);
    req.fusion = bundle.meta().assemble(req.base_scores);
    req.p_cal = bundle.calibrator().apply(bundle.meta().predict(req.fusion));
    req.tier = tier;
    return req;
}

ModelDescriptor linear_model(const std::string& name, std::vector<double> w) {
    return make_model(name, ModelFamily::ML, std::make_shared<LinearScorer>(std::move(w), 0.0),
                      AttributionMethod::Native);
}

bool has_factor(const Explanation& ex, const std::string& name) {
    return std::any_of(ex.risk_factors.begin(), ex.risk_factors.end(),
                       [&](const RiskFactor& rf) { return rf.factor == name; });
}

ExplainOptions options(int top, int timeout_ms) {
    ExplainOptions o;
    o.top_features = top;
    o.timeout_ms = timeout_ms;
    return o;
}

} // namespace

TEST_CASE("Contribution weights", "[explainer]") {
    MetaLearner meta(MetaKind::Linear, {2.0, -1.0}, 0.0, {0.5, 0.5});
    FusionVector fv;
    fv.values = {0.5, 0.5};
    fv.imputed = {false, false};
    
    auto w = Explainer::contribution_weights(meta, fv);
    REQUIRE_THAT(w[0], WithinAbs(2.0 / 3.0, 1e-12));
    REQUIRE_THAT(w[1], WithinAbs(-1.0 / 3.0, 1e-12));
    
    fv.values = {0.0, 0.0};
    auto zeros = Explainer::contribution_weights(meta, fv);
    REQUIRE(zeros == std::vector<double>{0.0, 0.0});
}

TEST_CASE("Feature attribution", "[explainer]") {
    std::vector<ModelDescriptor> models = {
        linear_model("lr_a", {2.0, 0.0, -1.0}),
        linear_model("lr_b", {2.0, 0.0, -1.0}),
        fixed_model("opaque", 0.5, 3, ModelFamily::DL),
        make_model("broken", ModelFamily::DL, std::make_shared<FailingScorer>(3))
    };
    auto bundle = make_bundle(models, averaging_meta(4));
    Explainer explainer(bundle, bundle->decision(), options(10, 1000));
    
    auto req = score_request(*bundle, {1.0, 1.0, 1.0}, RiskTier::Suspicious);
    Explanation ex = explainer.explain(req, nullptr);
    
    SECTION("Each model reports how its attribution went") {
        REQUIRE(ex.models.size() == 4);
        REQUIRE(ex.complete);
        for (const auto& me : ex.models) {
            if (me.model == "lr_a" || me.model == "lr_b") {
                REQUIRE(me.status == AttributionStatus::Computed);
                REQUIRE(me.top_features.size() == 2);
                REQUIRE(me.top_features[0].feature == "f0");
                REQUIRE(me.top_features[0].increases_risk());
            } else if (me.model == "opaque") {
                REQUIRE(me.status == AttributionStatus::Unsupported);
                REQUIRE(me.top_features.empty());
            } else {
                REQUIRE(me.status == AttributionStatus::ModelUnavailable);
                REQUIRE_FALSE(me.available);
            }
        }
    }
    
    SECTION("Models are ranked by contribution magnitude") {
        for (size_t i = 1; i < ex.models.size(); ++i) {
            REQUIRE(std::fabs(ex.models[i - 1].contribution_weight) >=
                    std::fabs(ex.models[i].contribution_weight));
        }
    }
    
    SECTION("Global attribution is the weighted, normalised sum") {
        REQUIRE(ex.global_features.size() == 2);
        REQUIRE(ex.global_features[0].feature == "f0");
        REQUIRE(ex.global_features[0].increases_risk());
        REQUIRE(ex.global_features[1].feature == "f2");
        REQUIRE_FALSE(ex.global_features[1].increases_risk());
        
        // Two equal linear models, each with L1-normalised attribution {2/3, 0, -1/3}
        auto weights = Explainer::contribution_weights(bundle->meta(), req.fusion);
        double w = weights[0] + weights[1];
        REQUIRE_THAT(ex.global_features[0].contribution, WithinAbs(w * 2.0 / 3.0, 1e-12));
        REQUIRE_THAT(ex.global_features[1].contribution, WithinAbs(-w / 3.0, 1e-12));
    }
    
    SECTION("Top-K bounds the global list") {
        Explainer narrow(bundle, bundle->decision(), options(1, 1000));
        Explanation top1 = narrow.explain(req, nullptr);
        REQUIRE(top1.global_features.size() == 1);
        REQUIRE(top1.global_features[0].feature == "f0");
    }
    
    SECTION("Pooled attribution matches inline attribution") {
        WorkerPool pool("test-explain", 2);
        Explanation pooled = explainer.explain(req, &pool);
        REQUIRE(pooled.global_features.size() == ex.global_features.size());
        for (size_t i = 0; i < pooled.global_features.size(); ++i) {
            REQUIRE(pooled.global_features[i].feature == ex.global_features[i].feature);
            REQUIRE_THAT(pooled.global_features[i].contribution,
                         WithinAbs(ex.global_features[i].contribution, 1e-12));
        }
    }
}

TEST_CASE("Partial explanations", "[explainer]") {
    std::vector<ModelDescriptor> models = {
        linear_model("fast", {1.0, 0.5, 0.0}),
        make_model("slow", ModelFamily::ML,
                   std::make_shared<SlowAttributionScorer>(std::vector<double>{0.0, 1.0, 1.0}, 400),
                   AttributionMethod::Native)
    };
    auto bundle = make_bundle(models, averaging_meta(2));
    Explainer explainer(bundle, bundle->decision(), options(10, 50));
    WorkerPool pool("test-partial", 2);
    
    auto req = score_request(*bundle, {1.0, 1.0, 1.0}, RiskTier::Suspicious);
    Explanation ex = explainer.explain(req, &pool);
    
    REQUIRE_FALSE(ex.complete);
    REQUIRE(ex.skipped == std::vector<std::string>{"slow"});
    for (const auto& me : ex.models) {
        if (me.model == "slow") {
            REQUIRE(me.status == AttributionStatus::SkippedTimeout);
        } else {
            REQUIRE(me.status == AttributionStatus::Computed);
        }
    }
    REQUIRE_FALSE(ex.global_features.empty());
    REQUIRE(ex.summary.find("partial") != std::string::npos);
}

TEST_CASE("Consensus and risk factors", "[explainer]") {
    DecisionConfig decision = default_decision();
    
    SECTION("FRAUD consensus counts every model above the high band") {
        std::vector<double> values = {0.95, 0.9, 0.8, 0.2};
        auto bundle = fixed_bundle(values);
        Explainer explainer(bundle, decision, options(10, 1000));
        auto req = score_request(*bundle, {1.0, 1.0, 1.0}, RiskTier::Fraud);
        req.p_cal = 0.95;
        Explanation ex = explainer.explain(req, nullptr);
        
        int above = static_cast<int>(std::count_if(values.begin(), values.end(),
                                                   [&](double p) { return p > decision.tier_high; }));
        REQUIRE(ex.consensus.fraud >= above);
        REQUIRE(ex.consensus.safe == 1);
        REQUIRE_THAT(ex.consensus.agreement_ratio, WithinAbs(0.75, 1e-12));
        REQUIRE_THAT(ex.consensus.min_score, WithinAbs(0.2, 1e-12));
        REQUIRE_THAT(ex.consensus.max_score, WithinAbs(0.95, 1e-12));
        
        REQUIRE(has_factor(ex, "Extremely High Fraud Risk"));
        REQUIRE_FALSE(has_factor(ex, "Model Disagreement"));
        REQUIRE(ex.risk_level == RiskLevel::Critical);
        REQUIRE(ex.recommendations.front() == "BLOCK transaction immediately");
        REQUIRE(ex.summary.rfind("This transaction was flagged as FRAUDULENT with a 95.0% fraud probability.", 0) == 0);
    }
    
    SECTION("Split models raise a disagreement factor") {
        auto bundle = fixed_bundle({0.95, 0.9, 0.5, 0.1, 0.05});
        Explainer explainer(bundle, decision, options(10, 1000));
        auto req = score_request(*bundle, {1.0, 1.0, 1.0}, RiskTier::Suspicious);
        Explanation ex = explainer.explain(req, nullptr);
        
        REQUIRE(ex.consensus.fraud == 2);
        REQUIRE(ex.consensus.safe == 2);
        REQUIRE(ex.consensus.suspicious == 1);
        REQUIRE(models_disagree(ex.consensus));
        REQUIRE(has_factor(ex, "Model Disagreement"));
        REQUIRE(ex.summary.rfind("Transaction classification: SUSPICIOUS", 0) == 0);
    }
    
    SECTION("Unavailable models are counted apart") {
        std::vector<BaseScore> scores(3);
        scores[0].available = true;
        scores[0].probability = 0.1;
        scores[1].available = true;
        scores[1].probability = 0.3;
        scores[2].available = false;
        
        ConsensusSummary c = consensus_summary(scores, RiskTier::Safe, decision);
        REQUIRE(c.unavailable == 1);
        REQUIRE(c.safe == 1);
        REQUIRE(c.suspicious == 1);
        REQUIRE_THAT(c.agreement_ratio, WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(c.std_dev, WithinAbs(0.1, 1e-12));
    }
    
    SECTION("Feature factors use business text when the bundle has it") {
        std::map<std::string, FeatureSemantic> semantics = {
            {"f0", {"High amount ratio ({value}x)", "Amount is {value} times the usual spend"}}
        };
        std::vector<ModelDescriptor> models = {linear_model("lr", {1.0, 0.0, 0.0})};
        auto bundle = std::make_shared<const ModelBundle>(
            "semantic-bundle", FeatureSchema("s", feature_names(3)), ScalingPolicy(),
            ModelRegistry(models), averaging_meta(1), Calibrator(), decision, RiskCuts(), semantics);
        Explainer explainer(bundle, decision, options(10, 1000));
        
        auto req = score_request(*bundle, {3.0, 1.0, 1.0}, RiskTier::Fraud);
        Explanation ex = explainer.explain(req, nullptr);
        
        REQUIRE(has_factor(ex, "High amount ratio (3.00x)"));
        auto it = std::find_if(ex.risk_factors.begin(), ex.risk_factors.end(),
                               [](const RiskFactor& rf) { return rf.feature == "f0"; });
        REQUIRE(it != ex.risk_factors.end());
        REQUIRE(it->severity == "high");
        REQUIRE(it->description == "Amount is 3.00 times the usual spend");
    }
}

TEST_CASE("Risk factor helpers", "[explainer]") {
    RiskCuts cuts;
    REQUIRE(severity_for(0.01, cuts).empty());
    REQUIRE(severity_for(0.03, cuts) == "low");
    REQUIRE(severity_for(0.1, cuts) == "medium");
    REQUIRE(severity_for(0.5, cuts) == "high");
    
    REQUIRE(render_semantic_text("{value} and {value}", 1.5) == "1.50 and 1.50");
    REQUIRE(render_semantic_text("no placeholder", 2.0) == "no placeholder");
    
    REQUIRE(attribution_status_string(AttributionStatus::SkippedTimeout) == "skipped_timeout");
}

TEST_CASE("Failed attribution marks the explanation incomplete", "[explainer]") {
    std::vector<ModelDescriptor> models = {
        linear_model("good", {1.0, 0.5, 0.0}),
        make_model("broken", ModelFamily::ML,
                   std::make_shared<BrokenAttributionScorer>(std::vector<double>{0.0, 1.0, 1.0}),
                   AttributionMethod::Native),
        fixed_model("opaque", 0.5, 3)
    };
    auto bundle = make_bundle(models, averaging_meta(3));
    Explainer explainer(bundle, bundle->decision(), options(10, 1000));
    auto req = score_request(*bundle, {1.0, 1.0, 1.0}, RiskTier::Suspicious);
    
    auto check = [](const Explanation& ex) {
        REQUIRE_FALSE(ex.complete);
        REQUIRE(ex.skipped.empty());
        REQUIRE(ex.failed == std::vector<std::string>{"broken"});
        for (const auto& me : ex.models) {
            if (me.model == "broken") {
                REQUIRE(me.status == AttributionStatus::Failed);
                REQUIRE(me.error == "attribution backend crashed");
            } else if (me.model == "opaque") {
                REQUIRE(me.status == AttributionStatus::Unsupported);
            } else {
                REQUIRE(me.status == AttributionStatus::Computed);
            }
        }
        REQUIRE_FALSE(ex.global_features.empty());
        REQUIRE(ex.summary.find("1 model(s) failed.") != std::string::npos);
    };
    
    SECTION("Inline") {
        check(explainer.explain(req, nullptr));
    }
    
    SECTION("On the explain pool") {
        WorkerPool pool("test-failed", 2);
        check(explainer.explain(req, &pool));
    }
}
