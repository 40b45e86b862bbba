#pragma once

#include "model_registry.hpp"
#include <string>
#include <vector>

// Base scores in canonical model order; failed slots carry the fallback value
struct FusionVector {
    std::vector<double> values;
    std::vector<bool> imputed;
    
    size_t imputed_count() const;
    size_t available_count() const { return values.size() - imputed_count(); }
};

enum class MetaKind {
    Logistic,   // sigmoid(intercept + c.s)
    Linear      // clamp(intercept + c.s, 0, 1)
};

std::string meta_kind_string(MetaKind kind);
MetaKind meta_kind_from_string(const std::string& name);

class MetaLearner {
public:
    MetaLearner(MetaKind kind, std::vector<double> coefficients, double intercept,
                std::vector<double> fallback);
    
    FusionVector assemble(const std::vector<BaseScore>& scores) const;
    
    // Raw fused probability
    double predict(const FusionVector& fv) const;
    
    // Per-slot c_i * s_i
    std::vector<double> contributions(const FusionVector& fv) const;
    
    MetaKind kind() const { return kind_; }
    size_t size() const { return coefficients_.size(); }
    const std::vector<double>& coefficients() const { return coefficients_; }
    const std::vector<double>& fallback() const { return fallback_; }
    double intercept() const { return intercept_; }
    
private:
    MetaKind kind_;
    std::vector<double> coefficients_;
    double intercept_;
    std::vector<double> fallback_;
};

enum class CalibrationMethod {
    None,
    Platt,      // sigmoid(a * p + b)
    Isotonic    // piecewise-linear over fitted breakpoints
};

std::string calibration_method_string(CalibrationMethod method);

class Calibrator {
public:
    Calibrator() = default;
    
    static Calibrator platt(double a, double b);
    
    // x strictly increasing, y non-decreasing, same length >= 2
    static Calibrator isotonic(std::vector<double> x, std::vector<double> y);
    
    // Always in [0,1]
    double apply(double p_raw) const;
    
    CalibrationMethod method() const { return method_; }
    
private:
    CalibrationMethod method_ = CalibrationMethod::None;
    double a_ = 1.0;
    double b_ = 0.0;
    std::vector<double> x_;
    std::vector<double> y_;
};
