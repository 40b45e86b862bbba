#include "fusion.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>

size_t FusionVector::imputed_count() const {
    return static_cast<size_t>(std::count(imputed.begin(), imputed.end(), true));
}

std::string meta_kind_string(MetaKind kind) {
    return kind == MetaKind::Logistic ? "logistic" : "linear";
}

MetaKind meta_kind_from_string(const std::string& name) {
    if (name == "logistic") return MetaKind::Logistic;
    if (name == "linear") return MetaKind::Linear;
    throw std::invalid_argument("Unknown meta-learner kind: " + name);
}

std::string calibration_method_string(CalibrationMethod method) {
    switch (method) {
        case CalibrationMethod::Platt: return "platt";
        case CalibrationMethod::Isotonic: return "isotonic";
        case CalibrationMethod::None: return "none";
    }
    return "none";
}

MetaLearner::MetaLearner(MetaKind kind, std::vector<double> coefficients, double intercept,
                         std::vector<double> fallback)
    : kind_(kind)
    , coefficients_(std::move(coefficients))
    , intercept_(intercept)
    , fallback_(std::move(fallback))
{
    if (coefficients_.empty()) {
        throw std::invalid_argument("meta-learner has no coefficients");
    }
    if (fallback_.size() != coefficients_.size()) {
        throw std::invalid_argument("meta-learner fallback size " + std::to_string(fallback_.size()) +
                                    " does not match " + std::to_string(coefficients_.size()) +
                                    " coefficients");
    }
}

FusionVector MetaLearner::assemble(const std::vector<BaseScore>& scores) const {
    if (scores.size() != coefficients_.size()) {
        throw std::invalid_argument("meta-learner expects " + std::to_string(coefficients_.size()) +
                                    " base scores, got " + std::to_string(scores.size()));
    }
    
    FusionVector fv;
    fv.values.resize(scores.size());
    fv.imputed.resize(scores.size());
    for (size_t i = 0; i < scores.size(); ++i) {
        if (scores[i].available) {
            fv.values[i] = scores[i].probability;
            fv.imputed[i] = false;
        } else {
            fv.values[i] = fallback_[i];
            fv.imputed[i] = true;
        }
    }
    return fv;
}

double MetaLearner::predict(const FusionVector& fv) const {
    double z = intercept_;
    for (size_t i = 0; i < coefficients_.size(); ++i) {
        z += coefficients_[i] * fv.values[i];
    }
    return kind_ == MetaKind::Logistic ? util::sigmoid(z) : util::clamp01(z);
}

std::vector<double> MetaLearner::contributions(const FusionVector& fv) const {
    std::vector<double> out(coefficients_.size());
    for (size_t i = 0; i < coefficients_.size(); ++i) {
        out[i] = coefficients_[i] * fv.values[i];
    }
    return out;
}

Calibrator Calibrator::platt(double a, double b) {
    Calibrator c;
    c.method_ = CalibrationMethod::Platt;
    c.a_ = a;
    c.b_ = b;
    return c;
}

Calibrator Calibrator::isotonic(std::vector<double> x, std::vector<double> y) {
    if (x.size() < 2 || x.size() != y.size()) {
        throw std::invalid_argument("isotonic calibrator needs matching breakpoints (at least 2)");
    }
    for (size_t i = 1; i < x.size(); ++i) {
        if (!(x[i] > x[i - 1])) {
            throw std::invalid_argument("isotonic breakpoints must be strictly increasing");
        }
        if (y[i] < y[i - 1]) {
            throw std::invalid_argument("isotonic calibrator is not monotone");
        }
    }
    
    Calibrator c;
    c.method_ = CalibrationMethod::Isotonic;
    c.x_ = std::move(x);
    c.y_ = std::move(y);
    return c;
}

double Calibrator::apply(double p_raw) const {
    switch (method_) {
        case CalibrationMethod::None:
            return util::clamp01(p_raw);
        case CalibrationMethod::Platt:
            return util::clamp01(util::sigmoid(a_ * p_raw + b_));
        case CalibrationMethod::Isotonic:
            break;
    }
    
    if (p_raw <= x_.front()) return util::clamp01(y_.front());
    if (p_raw >= x_.back()) return util::clamp01(y_.back());
    
    auto it = std::upper_bound(x_.begin(), x_.end(), p_raw);
    size_t hi = static_cast<size_t>(it - x_.begin());
    size_t lo = hi - 1;
    double t = (p_raw - x_[lo]) / (x_[hi] - x_[lo]);
    return util::clamp01(y_[lo] + t * (y_[hi] - y_[lo]));
}
