#include "model_registry.hpp"
#include "errors.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cmath>
#include <future>
#include <set>

ModelRegistry::ModelRegistry(std::vector<ModelDescriptor> models) : models_(std::move(models)) {
    std::set<std::string> seen;
    for (const auto& m : models_) {
        if (m.name.empty()) {
            throw std::invalid_argument("model name must not be empty");
        }
        if (!m.scorer) {
            throw std::invalid_argument("model " + m.name + " has no scorer");
        }
        if (!seen.insert(m.name).second) {
            throw std::invalid_argument("duplicate model name: " + m.name);
        }
    }
}

std::vector<ScalingVariant> ModelRegistry::required_variants() const {
    std::vector<ScalingVariant> variants;
    for (const auto& m : models_) {
        if (m.scaling == ScalingVariant::Raw) continue;
        bool present = false;
        for (auto v : variants) {
            if (v == m.scaling) present = true;
        }
        if (!present) variants.push_back(m.scaling);
    }
    return variants;
}

BaseScore ModelRegistry::abandoned(const ModelDescriptor& model) {
    BaseScore result;
    result.model = model.name;
    result.display_name = model.display_name;
    result.family = model.family;
    result.algorithm = model.algorithm();
    result.available = false;
    result.error = "cancelled";
    return result;
}

BaseScore ModelRegistry::score_one(const ModelDescriptor& model, const ScaledViews& views) {
    BaseScore result;
    result.model = model.name;
    result.display_name = model.display_name;
    result.family = model.family;
    result.algorithm = model.algorithm();
    
    auto start = util::Clock::now();
    try {
        const auto& x = views.view(model.scaling);
        if (x.size() != model.scorer->input_size()) {
            throw std::invalid_argument("input size " + std::to_string(x.size()) +
                                        " does not match model input " +
                                        std::to_string(model.scorer->input_size()));
        }
        
        double p = model.scorer->score(x);
        if (!std::isfinite(p)) {
            throw std::runtime_error("non-finite output");
        }
        result.probability = util::clamp01(p);
        result.available = true;
    } catch (const std::exception& e) {
        result.available = false;
        result.error = e.what();
        spdlog::warn("Model {} unavailable: {}", model.name, e.what());
    }
    result.latency_ms = util::elapsed_ms(start);
    
    return result;
}

std::vector<BaseScore> ModelRegistry::score_all(std::shared_ptr<const ScaledViews> views,
                                                WorkerPool* pool,
                                                util::Clock::time_point deadline,
                                                int budget_ms) const {
    std::vector<BaseScore> results;
    results.reserve(models_.size());
    
    if (!pool) {
        for (const auto& m : models_) {
            results.push_back(score_one(m, *views));
        }
        if (util::Clock::now() > deadline) {
            throw DownstreamTimeout("base model scoring", budget_ms);
        }
        return results;
    }
    
    // Each task owns copies of what it reads, so work abandoned after a
    // timeout never touches freed memory. Tasks that have not started when
    // the request is abandoned return without running their model.
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    std::vector<std::future<BaseScore>> futures;
    futures.reserve(models_.size());
    for (const auto& m : models_) {
        futures.push_back(pool->submit([m, views, cancelled]() {
            if (cancelled->load()) {
                return abandoned(m);
            }
            return score_one(m, *views);
        }));
    }
    
    for (size_t i = 0; i < futures.size(); ++i) {
        if (futures[i].wait_until(deadline) != std::future_status::ready) {
            cancelled->store(true);
            spdlog::warn("Base model scoring exceeded {}ms at model {}", budget_ms, models_[i].name);
            throw DownstreamTimeout("base model scoring", budget_ms);
        }
        results.push_back(futures[i].get());
    }
    
    return results;
}
