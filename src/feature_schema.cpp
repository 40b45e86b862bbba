#include "feature_schema.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

SchemaMode schema_mode_from_string(const std::string& mode) {
    if (mode == "strict") return SchemaMode::Strict;
    if (mode == "lenient") return SchemaMode::Lenient;
    throw std::invalid_argument("Unknown schema mode: " + mode);
}

std::string schema_mode_string(SchemaMode mode) {
    return mode == SchemaMode::Strict ? "strict" : "lenient";
}

FeatureSchema::FeatureSchema(std::string version, std::vector<std::string> names)
    : version_(std::move(version))
    , names_(std::move(names))
{
    if (names_.empty()) {
        throw std::invalid_argument("Feature schema must name at least one feature");
    }
    for (size_t i = 0; i < names_.size(); ++i) {
        if (names_[i].empty()) {
            throw std::invalid_argument("Feature schema contains an empty name");
        }
        if (!index_.emplace(names_[i], i).second) {
            throw std::invalid_argument("Duplicate feature in schema: " + names_[i]);
        }
    }
}

std::optional<size_t> FeatureSchema::index_of(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

FeatureValidator::FeatureValidator(const FeatureSchema& schema, SchemaMode mode)
    : schema_(schema), mode_(mode) {}

bool FeatureValidator::to_finite_double(const nlohmann::json& value, double& out) {
    if (value.is_number()) {
        out = value.get<double>();
        return std::isfinite(out);
    }
    if (value.is_string()) {
        double parsed = 0.0;
        if (!util::parse_double(value.get<std::string>(), parsed)) return false;
        out = parsed;
        return std::isfinite(out);
    }
    // null, bool, array, object
    return false;
}

FeatureVector FeatureValidator::validate(const nlohmann::json& raw) const {
    if (!raw.is_object()) {
        throw SchemaViolation({}, {}, {}, "features must be a JSON object");
    }
    
    std::vector<std::string> missing;
    std::vector<std::string> extra;
    std::vector<std::string> non_numeric;
    
    FeatureVector fv;
    fv.values.assign(schema_.size(), 0.0);
    
    const auto& names = schema_.names();
    for (size_t i = 0; i < names.size(); ++i) {
        auto it = raw.find(names[i]);
        if (it == raw.end()) {
            missing.push_back(names[i]);
            continue;
        }
        double v = 0.0;
        if (!to_finite_double(*it, v)) {
            non_numeric.push_back(names[i]);
            continue;
        }
        fv.values[i] = v;
    }
    
    for (auto it = raw.begin(); it != raw.end(); ++it) {
        if (!schema_.index_of(it.key())) {
            extra.push_back(it.key());
        }
    }
    
    if (!extra.empty() && mode_ == SchemaMode::Lenient) {
        spdlog::warn("Dropping {} unknown feature(s): {}", extra.size(), util::join(extra, ", "));
        extra.clear();
    }
    
    if (!missing.empty() || !extra.empty() || !non_numeric.empty()) {
        throw SchemaViolation(std::move(missing), std::move(extra), std::move(non_numeric));
    }
    
    return fv;
}
