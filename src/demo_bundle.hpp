#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Synthetic, deterministic bundle with the production model line-up:
// 63 engineered transaction features, 5 ML and 8 DL models, a logistic
// meta-learner and an isotonic calibrator
struct DemoBundle {
    nlohmann::json manifest;
    std::map<std::string, nlohmann::json> artifacts;   // relative path -> artifact
    std::vector<double> risk_direction;                 // signed weight per feature
};

std::vector<std::string> demo_feature_names();

DemoBundle build_demo_bundle(uint32_t seed = 20240611);

// Writes manifest.json plus ml/ and dl/ artifacts under `dir`
void write_demo_bundle(const DemoBundle& bundle, const std::string& dir);

// A raw transaction pushed along (or against) the bundle's risk direction
nlohmann::json demo_transaction(const DemoBundle& bundle, bool fraud_like, uint32_t seed);
