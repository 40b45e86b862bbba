#pragma once

#include "scaling.hpp"
#include <string>
#include <vector>
#include <memory>

enum class ModelFamily {
    ML,   // classical learners: linear, tree ensembles
    DL    // neural, sequence and reconstruction models
};

enum class AttributionMethod {
    Native,     // adapter computes exact local contributions
    Occlusion,  // score delta when a feature is reset to its baseline
    None        // local attribution omitted for this model
};

std::string model_family_string(ModelFamily family);
ModelFamily model_family_from_string(const std::string& name);
std::string attribution_method_string(AttributionMethod method);
AttributionMethod attribution_method_from_string(const std::string& name);

// Uniform scoring capability; every model family is adapted behind it
class Scorer {
public:
    virtual ~Scorer() = default;
    
    // `x` is already in the model's scaling variant. Returns a fraud
    // probability in [0,1].
    virtual double score(const std::vector<double>& x) const = 0;
    
    virtual size_t input_size() const = 0;
    virtual std::string algorithm() const = 0;
    
    virtual bool has_native_attribution() const { return false; }
    
    // Signed per-feature contribution; positive raises risk.
    virtual std::vector<double> native_attribution(const std::vector<double>& x) const;
};

std::vector<double> occlusion_attribution(const Scorer& scorer,
                                          const std::vector<double>& x,
                                          const std::vector<double>& baseline);

struct ModelDescriptor {
    std::string name;
    std::string display_name;
    ModelFamily family = ModelFamily::ML;
    ScalingVariant scaling = ScalingVariant::Raw;
    AttributionMethod attribution = AttributionMethod::None;
    std::shared_ptr<const Scorer> scorer;
    
    std::string algorithm() const { return scorer ? scorer->algorithm() : "unknown"; }
};
