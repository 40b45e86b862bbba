#include "linear_scorer.hpp"
#include "util.hpp"
#include <stdexcept>

LinearScorer::LinearScorer(std::vector<double> coefficients, double intercept)
    : coefficients_(std::move(coefficients)), intercept_(intercept)
{
    if (coefficients_.empty()) {
        throw std::invalid_argument("linear model has no coefficients");
    }
}

std::shared_ptr<LinearScorer> LinearScorer::from_json(const nlohmann::json& artifact) {
    return std::make_shared<LinearScorer>(
        artifact.at("coefficients").get<std::vector<double>>(),
        artifact.value("intercept", 0.0));
}

void LinearScorer::check_input(const std::vector<double>& x) const {
    if (x.size() != coefficients_.size()) {
        throw std::invalid_argument("linear model expects " + std::to_string(coefficients_.size()) +
                                    " inputs, got " + std::to_string(x.size()));
    }
}

double LinearScorer::score(const std::vector<double>& x) const {
    check_input(x);
    double z = intercept_;
    for (size_t i = 0; i < x.size(); ++i) {
        z += coefficients_[i] * x[i];
    }
    return util::sigmoid(z);
}

std::vector<double> LinearScorer::native_attribution(const std::vector<double>& x) const {
    check_input(x);
    std::vector<double> contributions(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        contributions[i] = coefficients_[i] * x[i];
    }
    return contributions;
}
