#pragma once

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

enum class SchemaMode {
    Strict,    // unknown keys are a violation
    Lenient    // unknown keys are dropped with a warning
};

SchemaMode schema_mode_from_string(const std::string& mode);
std::string schema_mode_string(SchemaMode mode);

class FeatureSchema {
public:
    FeatureSchema() = default;
    FeatureSchema(std::string version, std::vector<std::string> names);
    
    size_t size() const { return names_.size(); }
    const std::vector<std::string>& names() const { return names_; }
    const std::string& version() const { return version_; }
    std::optional<size_t> index_of(const std::string& name) const;
    
private:
    std::string version_;
    std::vector<std::string> names_;
    std::unordered_map<std::string, size_t> index_;
};

// Dense values in the schema's canonical order
struct FeatureVector {
    std::vector<double> values;
};

class FeatureValidator {
public:
    FeatureValidator(const FeatureSchema& schema, SchemaMode mode);
    
    // Throws SchemaViolation listing every missing, extra and non-numeric field
    FeatureVector validate(const nlohmann::json& raw) const;
    
private:
    const FeatureSchema& schema_;
    SchemaMode mode_;
    
    static bool to_finite_double(const nlohmann::json& value, double& out);
};
