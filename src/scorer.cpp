#include "scorer.hpp"
#include <stdexcept>

std::string model_family_string(ModelFamily family) {
    return family == ModelFamily::ML ? "ML" : "DL";
}

ModelFamily model_family_from_string(const std::string& name) {
    if (name == "ML" || name == "ml") return ModelFamily::ML;
    if (name == "DL" || name == "dl") return ModelFamily::DL;
    throw std::invalid_argument("Unknown model family: " + name);
}

std::string attribution_method_string(AttributionMethod method) {
    switch (method) {
        case AttributionMethod::Native: return "native";
        case AttributionMethod::Occlusion: return "occlusion";
        case AttributionMethod::None: return "none";
    }
    return "none";
}

AttributionMethod attribution_method_from_string(const std::string& name) {
    if (name == "native") return AttributionMethod::Native;
    if (name == "occlusion") return AttributionMethod::Occlusion;
    if (name == "none") return AttributionMethod::None;
    throw std::invalid_argument("Unknown attribution method: " + name);
}

std::vector<double> Scorer::native_attribution(const std::vector<double>&) const {
    throw std::logic_error(algorithm() + " scorer has no native attribution");
}

std::vector<double> occlusion_attribution(const Scorer& scorer,
                                          const std::vector<double>& x,
                                          const std::vector<double>& baseline) {
    if (baseline.size() != x.size()) {
        throw std::invalid_argument("occlusion baseline size does not match input");
    }
    
    const double full = scorer.score(x);
    std::vector<double> contributions(x.size(), 0.0);
    std::vector<double> probe = x;
    
    for (size_t i = 0; i < x.size(); ++i) {
        if (x[i] == baseline[i]) continue;
        probe[i] = baseline[i];
        contributions[i] = full - scorer.score(probe);
        probe[i] = x[i];
    }
    
    return contributions;
}
