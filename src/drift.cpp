#include "drift.hpp"
#include <fmt/format.h>
#include <cmath>

std::string OodWarning::message(double threshold) const {
    return fmt::format("ood_warning:{}:z={:.2f} (threshold={:.2f})", feature, z_score, threshold);
}

std::vector<OodWarning> out_of_distribution(const FeatureVector& fv,
                                            const FeatureSchema& schema,
                                            const StandardScaler* scaler,
                                            double z_threshold) {
    std::vector<OodWarning> out;
    if (!scaler || z_threshold <= 0.0) {
        return out;
    }
    
    const auto& mean = scaler->mean();
    const auto& scale = scaler->scale();
    for (size_t i = 0; i < fv.values.size() && i < mean.size(); ++i) {
        const double sd = scale[i];
        if (!std::isfinite(sd) || sd <= 1e-12) continue;
        
        const double z = (fv.values[i] - mean[i]) / sd;
        if (std::fabs(z) >= z_threshold) {
            out.push_back({schema.names()[i], fv.values[i], z});
        }
    }
    return out;
}
