#include "demo_bundle.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <filesystem>
#include <functional>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

namespace {

using Matrix = std::vector<std::vector<double>>;
using Rng = std::mt19937;

constexpr size_t kFeatures = 63;

const std::vector<std::string> kEngineered = {
    "card1_avg_time_gap", "card1_velocity", "card1_amt_mean", "card1_amt_std",
    "card1_amt_max", "card1_amt_min", "card1_txn_count", "card1_card2_freq",
    "card1_addr1_freq", "card2_amt_mean", "card2_amt_std", "card2_txn_count",
    "card2_emaildomain_freq", "device_amt_mean", "device_amt_std", "DeviceInfo_addr1_freq",
    "TransactionAmt", "TransactionAmt_to_meanAmt_ratio", "TransactionAmt_to_stdAmt_ratio",
    "amt_coefficient_variation", "velocity_x_amount", "transaction_hour", "is_foreign_transaction"
};

double sign(double v) {
    return v < 0.0 ? -1.0 : 1.0;
}

Matrix zeros(size_t rows, size_t cols) {
    return Matrix(rows, std::vector<double>(cols, 0.0));
}

nlohmann::json dense(const Matrix& w, std::vector<double> bias, const std::string& activation) {
    return {{"type", "dense"}, {"weights", w}, {"bias", bias}, {"activation", activation}};
}

// Sums of the risk direction per channel when features are laid out [steps][channels]
std::vector<double> channel_weights(const std::vector<double>& w, size_t channels) {
    std::vector<double> a(channels, 0.0);
    for (size_t i = 0; i < w.size(); ++i) a[i % channels] += w[i];
    return a;
}

nlohmann::json lstm(const Matrix& kernel, size_t units, bool return_sequences) {
    std::vector<double> bias(4 * units, 0.0);
    for (size_t u = 0; u < units; ++u) {
        bias[u] = 1.0;               // input gate
        bias[units + u] = 2.0;       // forget gate
        bias[3 * units + u] = 1.0;   // output gate
    }
    return {
        {"type", "lstm"},
        {"kernel", kernel},
        {"recurrent_kernel", zeros(units, 4 * units)},
        {"bias", bias},
        {"return_sequences", return_sequences}
    };
}

// Candidate-gate kernel: unit 0 accumulates risk, unit 1 accumulates safety
Matrix risk_safety_kernel(const std::vector<double>& channel_risk, double gain) {
    const size_t units = 2;
    Matrix k = zeros(channel_risk.size(), 4 * units);
    for (size_t c = 0; c < channel_risk.size(); ++c) {
        k[c][2 * units + 0] = gain * channel_risk[c];
        k[c][2 * units + 1] = -gain * channel_risk[c];
    }
    return k;
}

struct TreeGrower {
    const std::vector<double>& w;
    std::discrete_distribution<size_t> pick;
    std::normal_distribution<double> jitter{0.0, 0.3};
    Rng& rng;
    
    // Threshold on feature f; `center` and `spread` place it in the model's input space
    std::vector<double> center;
    std::vector<double> spread;
    
    int grow(nlohmann::json& nodes, int depth, double path, const std::function<double(double)>& leaf) {
        int idx = static_cast<int>(nodes.size());
        nodes.push_back(nlohmann::json::object());
        
        if (depth == 0) {
            nodes[idx] = {{"value", leaf(path)}};
            return idx;
        }
        
        size_t f = pick(rng);
        double threshold = center[f] + spread[f] * jitter(rng);
        int left = grow(nodes, depth - 1, path - sign(w[f]), leaf);
        int right = grow(nodes, depth - 1, path + sign(w[f]), leaf);
        nodes[idx] = {{"feature", f}, {"threshold", threshold}, {"left", left}, {"right", right}};
        return idx;
    }
};

nlohmann::json tree_ensemble(const std::vector<double>& w, Rng& rng, size_t trees, int depth,
                             const std::string& aggregation, double base_score,
                             std::vector<double> center, std::vector<double> spread,
                             const std::function<double(double)>& leaf) {
    std::vector<double> magnitude;
    for (double v : w) magnitude.push_back(std::fabs(v));
    
    TreeGrower grower{w, std::discrete_distribution<size_t>(magnitude.begin(), magnitude.end()),
                      std::normal_distribution<double>(0.0, 0.3), rng,
                      std::move(center), std::move(spread)};
    
    nlohmann::json jt = nlohmann::json::array();
    for (size_t t = 0; t < trees; ++t) {
        nlohmann::json nodes = nlohmann::json::array();
        grower.grow(nodes, depth, 0.0, leaf);
        jt.push_back({{"nodes", nodes}});
    }
    
    return {
        {"type", "tree_ensemble"},
        {"n_features", w.size()},
        {"aggregation", aggregation},
        {"base_score", base_score},
        {"trees", jt}
    };
}

nlohmann::json model_entry(const std::string& name, const std::string& display, const std::string& family,
                           const std::string& scaling, const std::string& artifact) {
    return {{"name", name}, {"display_name", display}, {"family", family},
            {"scaling", scaling}, {"artifact", artifact}};
}

} // namespace

std::vector<std::string> demo_feature_names() {
    std::vector<std::string> names = kEngineered;
    for (size_t v = 258; names.size() < kFeatures; ++v) {
        names.push_back("V" + std::to_string(v));
    }
    return names;
}

DemoBundle build_demo_bundle(uint32_t seed) {
    Rng rng(seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    
    DemoBundle demo;
    auto names = demo_feature_names();
    const size_t n = names.size();
    
    // Risk direction with L1 norm 4; engineered features weigh more
    std::vector<double> w(n);
    double l1 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        w[i] = normal(rng) * (i < kEngineered.size() ? 2.0 : 0.5);
        l1 += std::fabs(w[i]);
    }
    for (auto& v : w) v *= 4.0 / l1;
    demo.risk_direction = w;
    
    std::vector<double> mean(n), scale(n), data_min(n), data_max(n);
    for (size_t i = 0; i < n; ++i) {
        mean[i] = 50.0 * uniform(rng);
        scale[i] = 0.5 + 19.5 * uniform(rng);
        data_min[i] = mean[i] - 3.0 * scale[i];
        data_max[i] = mean[i] + 3.0 * scale[i];
    }
    
    std::vector<double> z_center(n, 0.0), z_spread(n, 1.0);
    
    // ---- ML family ----
    {
        std::vector<double> coef(n);
        for (size_t i = 0; i < n; ++i) coef[i] = w[i] + 0.02 * normal(rng);
        demo.artifacts["ml/logistic_regression.json"] = {
            {"type", "linear"}, {"coefficients", coef}, {"intercept", 0.0}
        };
    }
    demo.artifacts["ml/random_forest.json"] = tree_ensemble(
        w, rng, 25, 3, "mean", 0.0, mean, scale,
        [](double path) { return 1.0 / (1.0 + std::exp(-1.2 * path)); });
    demo.artifacts["ml/xgboost.json"] = tree_ensemble(
        w, rng, 30, 3, "logit_sum", 0.0, z_center, z_spread,
        [](double path) { return 0.06 * path; });
    demo.artifacts["ml/xgboost_smote.json"] = tree_ensemble(
        w, rng, 30, 3, "logit_sum", 0.2, z_center, z_spread,
        [](double path) { return 0.055 * path; });
    demo.artifacts["ml/catboost.json"] = tree_ensemble(
        w, rng, 20, 4, "logit_sum", 0.0, mean, scale,
        [](double path) { return 0.07 * path; });
    
    // ---- DL family ----
    auto flat_input = nlohmann::json{{"layout", "flat"}, {"size", n}};
    auto seq_input = [](size_t steps, size_t channels) {
        return nlohmann::json{{"layout", "sequence"}, {"shape", {steps, channels}}};
    };
    
    // Hidden units alternate between tracking risk and tracking safety
    auto projection = [&](size_t units, double noise) {
        Matrix m = zeros(n, units);
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = 0; j < units; ++j) {
                m[i][j] = (j % 2 == 0 ? 1.0 : -1.0) * w[i] + noise * normal(rng);
            }
        }
        return m;
    };
    auto readout = [](size_t units, double gain) {
        Matrix m = zeros(units, 1);
        for (size_t j = 0; j < units; ++j) m[j][0] = (j % 2 == 0 ? 1.0 : -1.0) * gain;
        return m;
    };
    
    demo.artifacts["dl/fnn.json"] = {
        {"type", "neural_net"},
        {"input", flat_input},
        {"layers", {
            dense(projection(16, 0.02), std::vector<double>(16, 0.0), "relu"),
            {{"type", "dropout"}, {"rate", 0.3}},
            dense(readout(16, 0.15), {0.0}, "sigmoid")
        }}
    };
    
    {
        Matrix head = zeros(24, 2);
        for (size_t j = 0; j < 24; ++j) {
            double v = (j % 2 == 0 ? 1.0 : -1.0) * 0.1;
            head[j][0] = -v / 2.0;
            head[j][1] = v / 2.0;
        }
        demo.artifacts["dl/fnn_tuned.json"] = {
            {"type", "neural_net"},
            {"input", flat_input},
            {"layers", {
                dense(projection(24, 0.02), std::vector<double>(24, 0.0), "relu"),
                {{"type", "batch_norm"},
                 {"gamma", std::vector<double>(24, 1.0)}, {"beta", std::vector<double>(24, 0.0)},
                 {"moving_mean", std::vector<double>(24, 0.0)},
                 {"moving_variance", std::vector<double>(24, 1.0)}, {"epsilon", 1e-3}},
                {{"type", "dropout"}, {"rate", 0.2}},
                dense(head, {0.0, 0.0}, "softmax")
            }}
        };
    }
    
    // Min-max inputs sit at (z + 3) / 6, so relu(u - 0.5) and relu(0.5 - u)
    // split z / 6 into its positive and negative parts
    std::vector<Matrix> split_conv(3, zeros(1, 2));
    split_conv[1][0][0] = 1.0;
    split_conv[1][0][1] = -1.0;
    nlohmann::json split_layer = {
        {"type", "conv1d"}, {"weights", split_conv}, {"bias", {-0.5, 0.5}},
        {"padding", "same"}, {"activation", "relu"}
    };
    
    {
        Matrix head = zeros(2 * n, 1);
        for (size_t t = 0; t < n; ++t) {
            head[2 * t][0] = 6.0 * w[t];
            head[2 * t + 1][0] = -6.0 * w[t];
        }
        demo.artifacts["dl/cnn.json"] = {
            {"type", "neural_net"},
            {"input", seq_input(n, 1)},
            {"layers", {split_layer, {{"type", "flatten"}}, dense(head, {0.0}, "sigmoid")}}
        };
    }
    
    {
        const size_t pool = 3, pooled = n / pool;
        Matrix head = zeros(2 * pooled, 1);
        for (size_t t = 0; t < pooled; ++t) {
            double window = 0.0;
            for (size_t k = 0; k < pool; ++k) window += w[t * pool + k];
            head[2 * t][0] = 6.0 * window;
            head[2 * t + 1][0] = -6.0 * window;
        }
        demo.artifacts["dl/cnn_tuned.json"] = {
            {"type", "neural_net"},
            {"input", seq_input(n, 1)},
            {"layers", {
                split_layer,
                {{"type", "max_pool1d"}, {"pool_size", pool}},
                {{"type", "flatten"}},
                dense(head, {0.0}, "sigmoid")
            }}
        };
    }
    
    {
        auto kernel = risk_safety_kernel(channel_weights(w, 7), 0.5);
        demo.artifacts["dl/lstm.json"] = {
            {"type", "neural_net"},
            {"input", seq_input(9, 7)},
            {"layers", {lstm(kernel, 2, false), dense({{2.0}, {-2.0}}, {0.0}, "sigmoid")}}
        };
        demo.artifacts["dl/bilstm.json"] = {
            {"type", "neural_net"},
            {"input", seq_input(9, 7)},
            {"layers", {
                {{"type", "bidirectional"},
                 {"forward", lstm(kernel, 2, false)},
                 {"backward", lstm(kernel, 2, false)}},
                dense({{1.0}, {-1.0}, {1.0}, {-1.0}}, {0.0}, "sigmoid")
            }}
        };
    }
    
    {
        auto a = channel_weights(w, 3);
        std::vector<Matrix> conv(3, zeros(3, 2));
        for (size_t c = 0; c < 3; ++c) {
            conv[1][c][0] = a[c];
            conv[1][c][1] = -a[c];
        }
        Matrix identity_kernel = zeros(2, 8);
        identity_kernel[0][4] = 1.0;   // channel 0 -> candidate of unit 0
        identity_kernel[1][5] = 1.0;   // channel 1 -> candidate of unit 1
        
        demo.artifacts["dl/cnn_bilstm.json"] = {
            {"type", "neural_net"},
            {"input", seq_input(21, 3)},
            {"layers", {
                {{"type", "conv1d"}, {"weights", conv}, {"bias", {0.0, 0.0}},
                 {"padding", "valid"}, {"activation", "relu"}},
                {{"type", "bidirectional"},
                 {"forward", lstm(identity_kernel, 2, true)},
                 {"backward", lstm(identity_kernel, 2, true)}},
                {{"type", "global_avg_pool1d"}},
                dense({{2.0}, {-2.0}, {2.0}, {-2.0}}, {0.0}, "sigmoid")
            }}
        };
    }
    
    {
        const size_t code = 8;
        Matrix enc = zeros(n, code), dec = zeros(code, n);
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = 0; j < code; ++j) {
                enc[i][j] = normal(rng) / std::sqrt(static_cast<double>(n));
                dec[j][i] = 0.5 * enc[i][j];
            }
        }
        demo.artifacts["dl/autoencoder.json"] = {
            {"type", "autoencoder"},
            {"input", flat_input},
            {"layers", {
                dense(enc, std::vector<double>(code, 0.0), "tanh"),
                dense(dec, std::vector<double>(n, 0.0), "linear")
            }},
            {"error_mapping", {{"method", "logistic"}, {"center", 1.6}, {"scale", 0.3}}}
        };
    }
    
    // ---- Manifest ----
    nlohmann::json models = {
        model_entry("logistic_regression", "Logistic Regression", "ML", "standard", "ml/logistic_regression.json"),
        model_entry("random_forest", "Random Forest", "ML", "raw", "ml/random_forest.json"),
        model_entry("xgboost", "XGBoost", "ML", "standard", "ml/xgboost.json"),
        model_entry("xgboost_smote", "XGBoost + SMOTE", "ML", "standard", "ml/xgboost_smote.json"),
        model_entry("catboost", "CatBoost", "ML", "raw", "ml/catboost.json"),
        model_entry("fnn", "Feedforward NN", "DL", "standard", "dl/fnn.json"),
        model_entry("fnn_tuned", "Feedforward NN (tuned)", "DL", "standard", "dl/fnn_tuned.json"),
        model_entry("cnn", "1D CNN", "DL", "minmax", "dl/cnn.json"),
        model_entry("cnn_tuned", "1D CNN (tuned)", "DL", "minmax", "dl/cnn_tuned.json"),
        model_entry("lstm", "LSTM", "DL", "standard", "dl/lstm.json"),
        model_entry("bilstm", "BiLSTM", "DL", "standard", "dl/bilstm.json"),
        model_entry("cnn_bilstm", "CNN-BiLSTM", "DL", "standard", "dl/cnn_bilstm.json"),
        model_entry("autoencoder", "Autoencoder", "DL", "standard", "dl/autoencoder.json")
    };
    
    std::vector<double> meta = {1.4, 1.6, 1.8, 1.5, 1.7, 1.0, 1.1, 0.9, 0.8, 0.3, 0.3, 0.3, 0.9};
    double coef_sum = 0.0;
    for (double c : meta) coef_sum += c;
    
    demo.manifest = {
        {"bundle_version", "demo-" + std::to_string(seed)},
        {"feature_schema_version", "fraud-features-63"},
        {"features", names},
        {"scalers", {
            {"standard", {{"mean", mean}, {"scale", scale}}},
            {"minmax", {{"data_min", data_min}, {"data_max", data_max},
                        {"feature_range", {0.0, 1.0}}, {"clip", false}}}
        }},
        {"models", models},
        {"expected_model_count", models.size()},
        {"meta_learner", {
            {"kind", "logistic"},
            {"coefficients", meta},
            {"intercept", -0.5 * coef_sum},
            {"fallback", std::vector<double>(meta.size(), 0.5)}
        }},
        {"calibrator", {
            {"method", "isotonic"},
            {"x", {0.0, 0.2, 0.5, 0.8, 1.0}},
            {"y", {0.0, 0.15, 0.5, 0.85, 1.0}}
        }},
        {"decision", {{"threshold", 0.4}, {"tier_low", 0.3}, {"tier_high", 0.7}}},
        {"risk_cuts", {{"low", 0.03}, {"medium", 0.08}, {"high", 0.15}}},
        {"feature_semantics", {
            {"TransactionAmt", {{"factor", "High-Value Transaction"},
                                {"description", "Transaction amount ${value} is unusually large for this card"}}},
            {"TransactionAmt_to_meanAmt_ratio", {{"factor", "Abnormally Large Amount"},
                                {"description", "Amount is {value}x the card's average transaction"}}},
            {"card1_velocity", {{"factor", "Rapid Transaction Burst"},
                                {"description", "Card is transacting at {value} transactions per hour"}}},
            {"card1_txn_count", {{"factor", "High Transaction Frequency"},
                                {"description", "{value} recent transactions on this card"}}},
            {"transaction_hour", {{"factor", "Unusual Transaction Time"},
                                {"description", "Transaction at hour {value}; most fraud occurs between midnight and 6 AM"}}},
            {"is_foreign_transaction", {{"factor", "Foreign Transaction Location"},
                                {"description", "Foreign transaction indicator is {value}"}}},
            {"velocity_x_amount", {{"factor", "Rapid High-Value Spending"},
                                {"description", "Velocity-weighted amount of {value}"}}},
            {"DeviceInfo_addr1_freq", {{"factor", "Device Information"},
                                {"description", "Device seen at this address {value} times"}}}
        }}
    };
    
    return demo;
}

void write_demo_bundle(const DemoBundle& bundle, const std::string& dir) {
    fs::path root(dir);
    fs::create_directories(root / "ml");
    fs::create_directories(root / "dl");
    
    auto write = [](const fs::path& path, const nlohmann::json& j) {
        std::ofstream out(path);
        if (!out) {
            throw std::runtime_error("cannot write " + path.string());
        }
        out << j.dump(2);
        if (!out) {
            throw std::runtime_error("write failed for " + path.string());
        }
    };
    
    write(root / "manifest.json", bundle.manifest);
    for (const auto& [rel, artifact] : bundle.artifacts) {
        write(root / rel, artifact);
    }
    
    spdlog::info("Wrote demo bundle {} with {} artifacts to {}",
                 bundle.manifest.value("bundle_version", ""), bundle.artifacts.size(), dir);
}

nlohmann::json demo_transaction(const DemoBundle& bundle, bool fraud_like, uint32_t seed) {
    Rng rng(seed);
    std::normal_distribution<double> noise(0.0, 0.3);
    
    const auto& names = bundle.manifest.at("features");
    const auto& standard = bundle.manifest.at("scalers").at("standard");
    auto mean = standard.at("mean").get<std::vector<double>>();
    auto scale = standard.at("scale").get<std::vector<double>>();
    
    nlohmann::json tx = nlohmann::json::object();
    for (size_t i = 0; i < names.size(); ++i) {
        double direction = sign(bundle.risk_direction[i]);
        double z = (fraud_like ? 1.5 : -1.0) * direction + noise(rng);
        tx[names[i].get<std::string>()] = mean[i] + scale[i] * z;
    }
    return tx;
}
