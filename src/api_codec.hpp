#pragma once

#include "engine.hpp"
#include <nlohmann/json.hpp>

void to_json(nlohmann::json& j, const BaseScore& s);
void to_json(nlohmann::json& j, const OodWarning& w);
void to_json(nlohmann::json& j, const EnsembleResult& r);
void to_json(nlohmann::json& j, const FeatureImpact& f);
void to_json(nlohmann::json& j, const ModelExplanation& m);
void to_json(nlohmann::json& j, const GlobalFeature& g);
void to_json(nlohmann::json& j, const RiskFactor& rf);
void to_json(nlohmann::json& j, const ConsensusSummary& c);
void to_json(nlohmann::json& j, const Explanation& e);
void to_json(nlohmann::json& j, const ExplainResult& r);
void to_json(nlohmann::json& j, const BatchItem& item);
void to_json(nlohmann::json& j, const HealthStatus& h);
void to_json(nlohmann::json& j, const EngineInfo& info);

// Error body: {"error": kind, "message": ..., plus the offending fields for schema errors}
nlohmann::json error_json(const EngineError& e);
nlohmann::json error_json(ErrorKind kind, const std::string& message);

// HTTP status for a failed request
int http_status_for(ErrorKind kind);

// Accepts a bare array or {"transactions": [...]}; throws SchemaViolation otherwise
std::vector<nlohmann::json> batch_items(const nlohmann::json& body);
