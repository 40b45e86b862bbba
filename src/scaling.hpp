#pragma once

#include "feature_schema.hpp"
#include <string>
#include <vector>
#include <optional>

enum class ScalingVariant {
    Raw,        // unscaled, as validated
    Standard,   // (x - mean) / scale
    MinMax      // (x - min) / (max - min), mapped into the fitted range
};

std::string scaling_variant_string(ScalingVariant variant);
ScalingVariant scaling_variant_from_string(const std::string& name);

class StandardScaler {
public:
    StandardScaler(std::vector<double> mean, std::vector<double> scale);
    
    std::vector<double> transform(const std::vector<double>& x) const;
    std::vector<double> inverse_transform(const std::vector<double>& z) const;
    
    size_t size() const { return mean_.size(); }
    const std::vector<double>& mean() const { return mean_; }
    const std::vector<double>& scale() const { return scale_; }
    
private:
    std::vector<double> mean_;
    std::vector<double> scale_;
};

class MinMaxScaler {
public:
    MinMaxScaler(std::vector<double> data_min, std::vector<double> data_max,
                 double range_min = 0.0, double range_max = 1.0, bool clip = false);
    
    std::vector<double> transform(const std::vector<double>& x) const;
    std::vector<double> inverse_transform(const std::vector<double>& z) const;
    
    size_t size() const { return data_min_.size(); }
    bool clips() const { return clip_; }
    
private:
    std::vector<double> data_min_;
    std::vector<double> data_range_;
    double range_min_;
    double range_max_;
    bool clip_;
};

struct ScaledViews {
    std::vector<double> raw;
    std::vector<double> standard;
    std::vector<double> minmax;
    bool has_standard = false;
    bool has_minmax = false;
    
    const std::vector<double>& view(ScalingVariant variant) const;
};

class ScalingPolicy {
public:
    void set_standard(StandardScaler scaler) { standard_ = std::move(scaler); }
    void set_minmax(MinMaxScaler scaler) { minmax_ = std::move(scaler); }
    
    bool supports(ScalingVariant variant) const;
    const StandardScaler* standard() const { return standard_ ? &*standard_ : nullptr; }
    const MinMaxScaler* minmax() const { return minmax_ ? &*minmax_ : nullptr; }
    
    // Only the variants in `required` are produced; raw is always present
    ScaledViews apply(const FeatureVector& fv,
                      const std::vector<ScalingVariant>& required) const;
    
private:
    std::optional<StandardScaler> standard_;
    std::optional<MinMaxScaler> minmax_;
};
