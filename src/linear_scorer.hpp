#pragma once

#include "scorer.hpp"
#include <nlohmann/json.hpp>

// Logistic regression: sigmoid(intercept + w.x)
class LinearScorer : public Scorer {
public:
    LinearScorer(std::vector<double> coefficients, double intercept);
    
    static std::shared_ptr<LinearScorer> from_json(const nlohmann::json& artifact);
    
    double score(const std::vector<double>& x) const override;
    size_t input_size() const override { return coefficients_.size(); }
    std::string algorithm() const override { return "linear"; }
    
    bool has_native_attribution() const override { return true; }
    std::vector<double> native_attribution(const std::vector<double>& x) const override;
    
private:
    std::vector<double> coefficients_;
    double intercept_;
    
    void check_input(const std::vector<double>& x) const;
};
