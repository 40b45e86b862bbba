#pragma once

#include "feature_schema.hpp"
#include "scaling.hpp"
#include <string>
#include <vector>

struct OodWarning {
    std::string feature;
    double value = 0.0;
    double z_score = 0.0;
    
    std::string message(double threshold) const;
};

// Features whose z-score against the fitted standard scaler reaches
// `z_threshold`. Empty when there is no scaler or the threshold is <= 0.
std::vector<OodWarning> out_of_distribution(const FeatureVector& fv,
                                            const FeatureSchema& schema,
                                            const StandardScaler* scaler,
                                            double z_threshold);
