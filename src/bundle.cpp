#include "bundle.hpp"
#include "errors.hpp"
#include "linear_scorer.hpp"
#include "neural_scorer.hpp"
#include "tree_scorer.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

nlohmann::json read_json_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw BundleLoadError("cannot open " + path.string());
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw BundleLoadError("corrupt JSON in " + path.string() + ": " + e.what());
    }
}

ScalingPolicy parse_scalers(const nlohmann::json& manifest) {
    ScalingPolicy policy;
    if (!manifest.contains("scalers")) {
        return policy;
    }
    
    const auto& scalers = manifest.at("scalers");
    if (scalers.contains("standard")) {
        const auto& s = scalers.at("standard");
        policy.set_standard(StandardScaler(s.at("mean").get<std::vector<double>>(),
                                           s.at("scale").get<std::vector<double>>()));
    }
    if (scalers.contains("minmax")) {
        const auto& s = scalers.at("minmax");
        double lo = 0.0, hi = 1.0;
        if (s.contains("feature_range")) {
            auto range = s.at("feature_range").get<std::vector<double>>();
            if (range.size() != 2) {
                throw std::invalid_argument("minmax feature_range must have two values");
            }
            lo = range[0];
            hi = range[1];
        }
        policy.set_minmax(MinMaxScaler(s.at("data_min").get<std::vector<double>>(),
                                       s.at("data_max").get<std::vector<double>>(),
                                       lo, hi, s.value("clip", false)));
    }
    return policy;
}

MetaLearner parse_meta(const nlohmann::json& j, size_t model_count) {
    auto coefficients = j.at("coefficients").get<std::vector<double>>();
    std::vector<double> fallback;
    if (j.contains("fallback")) {
        fallback = j.at("fallback").get<std::vector<double>>();
    } else {
        fallback.assign(model_count, 0.5);
    }
    return MetaLearner(meta_kind_from_string(j.value("kind", "logistic")),
                       std::move(coefficients), j.value("intercept", 0.0), std::move(fallback));
}

Calibrator parse_calibrator(const nlohmann::json& manifest) {
    if (!manifest.contains("calibrator") || manifest.at("calibrator").is_null()) {
        return Calibrator();
    }
    const auto& c = manifest.at("calibrator");
    std::string method = c.value("method", "none");
    if (method == "none") {
        return Calibrator();
    }
    if (method == "platt") {
        return Calibrator::platt(c.at("a").get<double>(), c.at("b").get<double>());
    }
    if (method == "isotonic") {
        return Calibrator::isotonic(c.at("x").get<std::vector<double>>(),
                                    c.at("y").get<std::vector<double>>());
    }
    throw std::invalid_argument("unknown calibration method: " + method);
}

DecisionConfig parse_decision(const nlohmann::json& manifest) {
    DecisionConfig d;
    if (manifest.contains("decision")) {
        const auto& j = manifest.at("decision");
        d.threshold = j.value("threshold", d.threshold);
        d.tier_low = j.value("tier_low", d.tier_low);
        d.tier_high = j.value("tier_high", d.tier_high);
    }
    return d;
}

RiskCuts parse_risk_cuts(const nlohmann::json& manifest) {
    RiskCuts cuts;
    if (manifest.contains("risk_cuts")) {
        const auto& j = manifest.at("risk_cuts");
        cuts.low = j.value("low", cuts.low);
        cuts.medium = j.value("medium", cuts.medium);
        cuts.high = j.value("high", cuts.high);
    }
    return cuts;
}

std::map<std::string, FeatureSemantic> parse_semantics(const nlohmann::json& manifest) {
    std::map<std::string, FeatureSemantic> out;
    if (!manifest.contains("feature_semantics")) {
        return out;
    }
    for (const auto& [feature, j] : manifest.at("feature_semantics").items()) {
        FeatureSemantic s;
        s.factor = j.at("factor").get<std::string>();
        s.description = j.value("description", "");
        out.emplace(feature, std::move(s));
    }
    return out;
}

} // namespace

// ---- ModelBundle ----

ModelBundle::ModelBundle(std::string version, FeatureSchema schema, ScalingPolicy scaling,
                         ModelRegistry registry, MetaLearner meta, Calibrator calibrator,
                         DecisionConfig decision, RiskCuts risk_cuts,
                         std::map<std::string, FeatureSemantic> semantics)
    : version_(std::move(version))
    , schema_(std::move(schema))
    , scaling_(std::move(scaling))
    , registry_(std::move(registry))
    , meta_(std::move(meta))
    , calibrator_(std::move(calibrator))
    , decision_(decision)
    , risk_cuts_(risk_cuts)
    , semantics_(std::move(semantics))
{
    const size_t n = schema_.size();
    if (n == 0) {
        throw std::invalid_argument("feature schema is empty");
    }
    if (scaling_.standard() && scaling_.standard()->size() != n) {
        throw std::invalid_argument(fmt::format("standard scaler has {} features, schema has {}",
                                                scaling_.standard()->size(), n));
    }
    if (scaling_.minmax() && scaling_.minmax()->size() != n) {
        throw std::invalid_argument(fmt::format("minmax scaler has {} features, schema has {}",
                                                scaling_.minmax()->size(), n));
    }
    if (registry_.size() == 0) {
        throw std::invalid_argument("bundle has no models");
    }
    
    for (const auto& m : registry_.models()) {
        if (!scaling_.supports(m.scaling)) {
            throw std::invalid_argument(fmt::format("model {} needs the {} scaler, which the bundle lacks",
                                                    m.name, scaling_variant_string(m.scaling)));
        }
        if (m.scorer->input_size() != n) {
            throw std::invalid_argument(fmt::format("model {} takes {} inputs, schema has {}",
                                                    m.name, m.scorer->input_size(), n));
        }
        if (m.attribution == AttributionMethod::Native && !m.scorer->has_native_attribution()) {
            throw std::invalid_argument(fmt::format("model {} ({}) has no native attribution",
                                                    m.name, m.algorithm()));
        }
    }
    
    if (meta_.size() != registry_.size()) {
        throw std::invalid_argument(fmt::format("meta-learner has {} coefficients for {} models",
                                                meta_.size(), registry_.size()));
    }
    
    decision_.validate();
    
    if (!(risk_cuts_.low > 0.0 && risk_cuts_.low <= risk_cuts_.medium &&
          risk_cuts_.medium <= risk_cuts_.high)) {
        throw std::invalid_argument("risk cuts must satisfy 0 < low <= medium <= high");
    }
    
    FeatureVector reference;
    if (scaling_.standard()) {
        reference.values = scaling_.standard()->mean();
    } else {
        reference.values.assign(n, 0.0);
    }
    baseline_ = scaling_.apply(reference, registry_.required_variants());
}

size_t ModelBundle::ml_count() const {
    size_t count = 0;
    for (const auto& m : registry_.models()) {
        if (m.family == ModelFamily::ML) ++count;
    }
    return count;
}

size_t ModelBundle::dl_count() const {
    return registry_.size() - ml_count();
}

// ---- BundleLoader ----

std::shared_ptr<const Scorer> BundleLoader::make_scorer(const nlohmann::json& artifact) {
    std::string type = artifact.at("type").get<std::string>();
    if (type == "linear") return LinearScorer::from_json(artifact);
    if (type == "tree_ensemble") return TreeEnsembleScorer::from_json(artifact);
    if (type == "neural_net") return NeuralNetScorer::from_json(artifact);
    if (type == "autoencoder") return ReconstructionScorer::from_json(artifact);
    throw std::invalid_argument("unknown model type: " + type);
}

AttributionMethod BundleLoader::default_attribution(const nlohmann::json& artifact) {
    std::string type = artifact.value("type", "");
    if (type == "linear" || type == "tree_ensemble") {
        return AttributionMethod::Native;
    }
    if (type == "neural_net") {
        bool sequence = artifact.contains("input") &&
                        artifact.at("input").value("layout", "flat") == "sequence";
        return sequence ? AttributionMethod::None : AttributionMethod::Occlusion;
    }
    if (type == "autoencoder") {
        return AttributionMethod::Occlusion;
    }
    return AttributionMethod::None;
}

std::shared_ptr<const ModelBundle> BundleLoader::load(const std::string& dir) {
    fs::path root(dir);
    if (!fs::is_directory(root)) {
        throw BundleLoadError("bundle directory not found: " + dir);
    }
    
    nlohmann::json manifest = read_json_file(root / "manifest.json");
    return from_manifest(manifest, dir);
}

std::shared_ptr<const ModelBundle> BundleLoader::from_manifest(const nlohmann::json& manifest,
                                                               const std::string& dir) {
    fs::path root(dir);
    
    try {
        std::string version = manifest.at("bundle_version").get<std::string>();
        FeatureSchema schema(manifest.value("feature_schema_version", version),
                             manifest.at("features").get<std::vector<std::string>>());
        
        std::vector<ModelDescriptor> models;
        for (const auto& entry : manifest.at("models")) {
            ModelDescriptor md;
            md.name = entry.at("name").get<std::string>();
            md.display_name = entry.value("display_name", md.name);
            md.family = model_family_from_string(entry.at("family").get<std::string>());
            md.scaling = scaling_variant_from_string(entry.value("scaling", "raw"));
            
            fs::path artifact_path = root / entry.at("artifact").get<std::string>();
            nlohmann::json artifact = read_json_file(artifact_path);
            try {
                md.scorer = make_scorer(artifact);
            } catch (const BundleLoadError&) {
                throw;
            } catch (const std::exception& e) {
                throw BundleLoadError(fmt::format("model {} ({}): {}", md.name,
                                                  artifact_path.string(), e.what()));
            }
            
            md.attribution = entry.contains("attribution")
                ? attribution_method_from_string(entry.at("attribution").get<std::string>())
                : default_attribution(artifact);
            
            spdlog::debug("Loaded model {} [{}] {} scaling={} attribution={}",
                          md.name, model_family_string(md.family), md.algorithm(),
                          scaling_variant_string(md.scaling),
                          attribution_method_string(md.attribution));
            models.push_back(std::move(md));
        }
        
        if (manifest.contains("expected_model_count")) {
            size_t expected = manifest.at("expected_model_count").get<size_t>();
            if (models.size() != expected) {
                throw BundleLoadError(fmt::format("bundle lists {} models, expected {}",
                                                  models.size(), expected));
            }
        }
        
        size_t model_count = models.size();
        auto bundle = std::make_shared<const ModelBundle>(
            version, std::move(schema), parse_scalers(manifest),
            ModelRegistry(std::move(models)),
            parse_meta(manifest.at("meta_learner"), model_count),
            parse_calibrator(manifest), parse_decision(manifest),
            parse_risk_cuts(manifest), parse_semantics(manifest));
        
        spdlog::info("Loaded bundle {} ({} features, {} ML + {} DL models, calibrator={})",
                     bundle->version(), bundle->schema().size(), bundle->ml_count(),
                     bundle->dl_count(), calibration_method_string(bundle->calibrator().method()));
        return bundle;
        
    } catch (const BundleLoadError&) {
        throw;
    } catch (const std::exception& e) {
        throw BundleLoadError(std::string("invalid bundle: ") + e.what());
    }
}
