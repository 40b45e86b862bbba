#pragma once

#include "scorer.hpp"
#include "util.hpp"
#include <memory>
#include <string>
#include <vector>

class WorkerPool;

// One model's output for one request; `available == false` marks a failed model
struct BaseScore {
    std::string model;
    std::string display_name;
    ModelFamily family = ModelFamily::ML;
    std::string algorithm;
    bool available = false;
    double probability = 0.0;
    double latency_ms = 0.0;
    std::string error;
};

class ModelRegistry {
public:
    // Models are kept in the given (canonical) order
    explicit ModelRegistry(std::vector<ModelDescriptor> models);
    
    const std::vector<ModelDescriptor>& models() const { return models_; }
    size_t size() const { return models_.size(); }
    
    // Distinct scaling variants needed by at least one model
    std::vector<ScalingVariant> required_variants() const;
    
    // Scores every model independently and returns results in canonical
    // order. With a pool the models run concurrently; a model still running
    // at `deadline` fails the whole call with DownstreamTimeout and models
    // not yet started for it are never run.
    std::vector<BaseScore> score_all(std::shared_ptr<const ScaledViews> views,
                                     WorkerPool* pool,
                                     util::Clock::time_point deadline,
                                     int budget_ms) const;
    
    // Never throws; failures are reported in the returned BaseScore
    static BaseScore score_one(const ModelDescriptor& model, const ScaledViews& views);
    
    // Unavailable score for a model whose request was abandoned before it ran
    static BaseScore abandoned(const ModelDescriptor& model);
    
private:
    std::vector<ModelDescriptor> models_;
};
