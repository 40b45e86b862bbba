#pragma once

#include "../src/bundle.hpp"
#include "../src/scorer.hpp"
#include "../src/linear_scorer.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

// Returns the same probability for every input
class FixedScorer : public Scorer {
public:
    FixedScorer(double value, size_t n) : value_(value), n_(n) {}
    
    double score(const std::vector<double>&) const override { return value_; }
    size_t input_size() const override { return n_; }
    std::string algorithm() const override { return "fixed"; }
    
private:
    double value_;
    size_t n_;
};

class FailingScorer : public Scorer {
public:
    explicit FailingScorer(size_t n) : n_(n) {}
    
    double score(const std::vector<double>&) const override {
        throw std::runtime_error("model backend crashed");
    }
    size_t input_size() const override { return n_; }
    std::string algorithm() const override { return "failing"; }
    
private:
    size_t n_;
};

// Sleeps before answering; used to trip deadlines
class SlowScorer : public Scorer {
public:
    SlowScorer(double value, size_t n, int delay_ms) : value_(value), n_(n), delay_ms_(delay_ms) {}
    
    double score(const std::vector<double>&) const override {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        return value_;
    }
    size_t input_size() const override { return n_; }
    std::string algorithm() const override { return "slow"; }
    
private:
    double value_;
    size_t n_;
    int delay_ms_;
};

// Sleeps like SlowScorer and counts how many times it was run
class CountingScorer : public Scorer {
public:
    CountingScorer(std::shared_ptr<std::atomic<int>> calls, size_t n, int delay_ms)
        : calls_(std::move(calls)), n_(n), delay_ms_(delay_ms) {}
    
    double score(const std::vector<double>&) const override {
        calls_->fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        return 0.5;
    }
    size_t input_size() const override { return n_; }
    std::string algorithm() const override { return "counting"; }
    
private:
    std::shared_ptr<std::atomic<int>> calls_;
    size_t n_;
    int delay_ms_;
};

// Linear model whose attribution throws
class BrokenAttributionScorer : public LinearScorer {
public:
    explicit BrokenAttributionScorer(std::vector<double> w) : LinearScorer(std::move(w), 0.0) {}
    
    std::vector<double> native_attribution(const std::vector<double>&) const override {
        throw std::runtime_error("attribution backend crashed");
    }
};

// Linear model whose attribution is slow
class SlowAttributionScorer : public LinearScorer {
public:
    SlowAttributionScorer(std::vector<double> w, int delay_ms)
        : LinearScorer(std::move(w), 0.0), delay_ms_(delay_ms) {}
    
    std::vector<double> native_attribution(const std::vector<double>& x) const override {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        return LinearScorer::native_attribution(x);
    }
    
private:
    int delay_ms_;
};

inline std::vector<std::string> feature_names(size_t n) {
    std::vector<std::string> names;
    for (size_t i = 0; i < n; ++i) names.push_back("f" + std::to_string(i));
    return names;
}

inline nlohmann::json features_json(size_t n, double value = 1.0) {
    nlohmann::json j = nlohmann::json::object();
    for (size_t i = 0; i < n; ++i) j["f" + std::to_string(i)] = value;
    return j;
}

inline ModelDescriptor make_model(const std::string& name, ModelFamily family,
                                  std::shared_ptr<const Scorer> scorer,
                                  AttributionMethod attribution = AttributionMethod::None) {
    ModelDescriptor md;
    md.name = name;
    md.display_name = name;
    md.family = family;
    md.scaling = ScalingVariant::Raw;
    md.attribution = attribution;
    md.scorer = std::move(scorer);
    return md;
}

inline ModelDescriptor fixed_model(const std::string& name, double value, size_t n,
                                   ModelFamily family = ModelFamily::ML) {
    return make_model(name, family, std::make_shared<FixedScorer>(value, n));
}

inline DecisionConfig default_decision() {
    DecisionConfig d;
    d.threshold = 0.4;
    d.tier_low = 0.3;
    d.tier_high = 0.7;
    return d;
}

// Averages the base scores: p_raw = mean(s), exact for fixed scorers
inline MetaLearner averaging_meta(size_t models) {
    return MetaLearner(MetaKind::Linear, std::vector<double>(models, 1.0 / models), 0.0,
                       std::vector<double>(models, 0.5));
}

inline std::shared_ptr<const ModelBundle> make_bundle(std::vector<ModelDescriptor> models,
                                                      MetaLearner meta,
                                                      size_t n_features = 3,
                                                      DecisionConfig decision = default_decision(),
                                                      Calibrator calibrator = Calibrator()) {
    return std::make_shared<const ModelBundle>(
        "test-bundle", FeatureSchema("test-schema", feature_names(n_features)),
        ScalingPolicy(), ModelRegistry(std::move(models)), std::move(meta),
        std::move(calibrator), decision);
}

// Bundle of `values.size()` fixed ML models fused by averaging
inline std::shared_ptr<const ModelBundle> fixed_bundle(const std::vector<double>& values,
                                                       size_t n_features = 3) {
    std::vector<ModelDescriptor> models;
    for (size_t i = 0; i < values.size(); ++i) {
        models.push_back(fixed_model("m" + std::to_string(i), values[i], n_features));
    }
    return make_bundle(std::move(models), averaging_meta(values.size()), n_features);
}
