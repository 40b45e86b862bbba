#include "scaling.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::string scaling_variant_string(ScalingVariant variant) {
    switch (variant) {
        case ScalingVariant::Raw: return "raw";
        case ScalingVariant::Standard: return "standard";
        case ScalingVariant::MinMax: return "minmax";
    }
    return "raw";
}

ScalingVariant scaling_variant_from_string(const std::string& name) {
    if (name == "raw" || name == "none") return ScalingVariant::Raw;
    if (name == "standard") return ScalingVariant::Standard;
    if (name == "minmax") return ScalingVariant::MinMax;
    throw std::invalid_argument("Unknown scaling variant: " + name);
}

namespace {

void require_same_size(size_t expected, size_t actual, const char* what) {
    if (expected != actual) {
        throw std::invalid_argument(std::string(what) + ": expected " +
                                    std::to_string(expected) + " values, got " +
                                    std::to_string(actual));
    }
}

} // namespace

StandardScaler::StandardScaler(std::vector<double> mean, std::vector<double> scale)
    : mean_(std::move(mean)), scale_(std::move(scale))
{
    require_same_size(mean_.size(), scale_.size(), "StandardScaler scale");
    for (auto& s : scale_) {
        if (!std::isfinite(s)) {
            throw std::invalid_argument("StandardScaler scale must be finite");
        }
        // Zero-variance features were fitted with unit scale
        if (s == 0.0) s = 1.0;
    }
}

std::vector<double> StandardScaler::transform(const std::vector<double>& x) const {
    require_same_size(mean_.size(), x.size(), "StandardScaler input");
    std::vector<double> z(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        z[i] = (x[i] - mean_[i]) / scale_[i];
    }
    return z;
}

std::vector<double> StandardScaler::inverse_transform(const std::vector<double>& z) const {
    require_same_size(mean_.size(), z.size(), "StandardScaler input");
    std::vector<double> x(z.size());
    for (size_t i = 0; i < z.size(); ++i) {
        x[i] = z[i] * scale_[i] + mean_[i];
    }
    return x;
}

MinMaxScaler::MinMaxScaler(std::vector<double> data_min, std::vector<double> data_max,
                           double range_min, double range_max, bool clip)
    : data_min_(std::move(data_min))
    , range_min_(range_min)
    , range_max_(range_max)
    , clip_(clip)
{
    require_same_size(data_min_.size(), data_max.size(), "MinMaxScaler data_max");
    if (!(range_min_ < range_max_)) {
        throw std::invalid_argument("MinMaxScaler feature_range must be increasing");
    }
    data_range_.resize(data_min_.size());
    for (size_t i = 0; i < data_min_.size(); ++i) {
        double r = data_max[i] - data_min_[i];
        if (!std::isfinite(r) || r < 0.0) {
            throw std::invalid_argument("MinMaxScaler data_max must not be below data_min");
        }
        data_range_[i] = (r == 0.0) ? 1.0 : r;
    }
}

std::vector<double> MinMaxScaler::transform(const std::vector<double>& x) const {
    require_same_size(data_min_.size(), x.size(), "MinMaxScaler input");
    const double span = range_max_ - range_min_;
    std::vector<double> z(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        double v = (x[i] - data_min_[i]) / data_range_[i] * span + range_min_;
        if (clip_) {
            v = std::max(range_min_, std::min(range_max_, v));
        }
        z[i] = v;
    }
    return z;
}

std::vector<double> MinMaxScaler::inverse_transform(const std::vector<double>& z) const {
    require_same_size(data_min_.size(), z.size(), "MinMaxScaler input");
    const double span = range_max_ - range_min_;
    std::vector<double> x(z.size());
    for (size_t i = 0; i < z.size(); ++i) {
        x[i] = (z[i] - range_min_) / span * data_range_[i] + data_min_[i];
    }
    return x;
}

const std::vector<double>& ScaledViews::view(ScalingVariant variant) const {
    switch (variant) {
        case ScalingVariant::Raw:
            return raw;
        case ScalingVariant::Standard:
            if (!has_standard) throw std::logic_error("standard view was not produced");
            return standard;
        case ScalingVariant::MinMax:
            if (!has_minmax) throw std::logic_error("minmax view was not produced");
            return minmax;
    }
    return raw;
}

bool ScalingPolicy::supports(ScalingVariant variant) const {
    switch (variant) {
        case ScalingVariant::Raw: return true;
        case ScalingVariant::Standard: return standard_.has_value();
        case ScalingVariant::MinMax: return minmax_.has_value();
    }
    return false;
}

ScaledViews ScalingPolicy::apply(const FeatureVector& fv,
                                 const std::vector<ScalingVariant>& required) const {
    ScaledViews views;
    views.raw = fv.values;
    
    for (auto variant : required) {
        if (variant == ScalingVariant::Standard && !views.has_standard) {
            if (!standard_) throw std::logic_error("bundle has no standard scaler");
            views.standard = standard_->transform(fv.values);
            views.has_standard = true;
        } else if (variant == ScalingVariant::MinMax && !views.has_minmax) {
            if (!minmax_) throw std::logic_error("bundle has no minmax scaler");
            views.minmax = minmax_->transform(fv.values);
            views.has_minmax = true;
        }
    }
    
    return views;
}
