#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/bundle.hpp"
#include "../src/demo_bundle.hpp"
#include "../src/engine.hpp"
#include "../src/errors.hpp"
#include "../src/util.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

// Scratch directory removed when the test ends
struct TempDir {
    fs::path path;
    
    TempDir() {
        static std::atomic<int> counter{0};
        path = fs::temp_directory_path() /
               ("fraudfusion_test_" + std::to_string(util::current_timestamp_ms()) + "_" +
                std::to_string(counter++));
        fs::create_directories(path);
    }
    
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    
    std::string str() const { return path.string(); }
};

void overwrite(const fs::path& file, const std::string& content) {
    std::ofstream out(file, std::ios::trunc);
    out << content;
}

EngineOptions demo_options() {
    EngineOptions o;
    o.min_quorum = 10;
    o.worker_threads = 4;
    o.explain_workers = 2;
    return o;
}

} // namespace

TEST_CASE("Loading the demo bundle", "[bundle]") {
    TempDir dir;
    DemoBundle demo = build_demo_bundle();
    write_demo_bundle(demo, dir.str());
    
    auto bundle = BundleLoader::load(dir.str());
    
    SECTION("Full production line-up is present") {
        REQUIRE(bundle->version() == "demo-20240611");
        REQUIRE(bundle->schema().size() == 63);
        REQUIRE(bundle->schema().version() == "fraud-features-63");
        REQUIRE(bundle->registry().size() == 13);
        REQUIRE(bundle->ml_count() == 5);
        REQUIRE(bundle->dl_count() == 8);
        REQUIRE(bundle->meta().kind() == MetaKind::Logistic);
        REQUIRE(bundle->calibrator().method() == CalibrationMethod::Isotonic);
        REQUIRE(bundle->scaling().standard() != nullptr);
        REQUIRE(bundle->scaling().minmax() != nullptr);
        REQUIRE(bundle->semantics().count("TransactionAmt") == 1);
    }
    
    SECTION("Model order follows the manifest") {
        const auto& models = bundle->registry().models();
        REQUIRE(models.front().name == "logistic_regression");
        REQUIRE(models.back().name == "autoencoder");
        REQUIRE(models[1].algorithm() == "tree_ensemble");
        REQUIRE(models[5].algorithm() == "neural_net");
        REQUIRE(models.back().algorithm() == "autoencoder");
    }
    
    SECTION("Attribution defaults depend on the model type") {
        const auto& models = bundle->registry().models();
        REQUIRE(models[0].attribution == AttributionMethod::Native);
        REQUIRE(models[1].attribution == AttributionMethod::Native);
        REQUIRE(models[5].attribution == AttributionMethod::Occlusion);
        REQUIRE(models[7].attribution == AttributionMethod::None);
        REQUIRE(models[12].attribution == AttributionMethod::Occlusion);
    }
    
    SECTION("Fraud-like and normal transactions land in opposite tiers") {
        InferenceEngine engine(bundle, demo_options());
        
        EnsembleResult fraud = engine.predict(demo_transaction(demo, true, 7));
        REQUIRE(fraud.tier == RiskTier::Fraud);
        REQUIRE(fraud.binary);
        REQUIRE(fraud.ml_used == 5);
        REQUIRE(fraud.dl_used == 8);
        REQUIRE(fraud.unavailable.empty());
        
        EnsembleResult normal = engine.predict(demo_transaction(demo, false, 7));
        REQUIRE(normal.tier == RiskTier::Safe);
        REQUIRE_FALSE(normal.binary);
        REQUIRE(normal.p_cal < fraud.p_cal);
    }
    
    SECTION("Fraud explanation names business risk factors") {
        InferenceEngine engine(bundle, demo_options());
        ExplainResult out = engine.explain(demo_transaction(demo, true, 11));
        
        REQUIRE(out.explanation.complete);
        REQUIRE(out.explanation.models.size() == 13);
        REQUIRE_FALSE(out.explanation.global_features.empty());
        REQUIRE(out.explanation.global_features.size() <= 10);
        REQUIRE_FALSE(out.explanation.risk_factors.empty());
        REQUIRE(out.explanation.recommendations.front() == "BLOCK transaction immediately");
    }
    
    SECTION("The same seed builds the same bundle") {
        DemoBundle again = build_demo_bundle();
        REQUIRE(again.manifest == demo.manifest);
        REQUIRE(again.artifacts == demo.artifacts);
    }
}

TEST_CASE("Rejecting broken bundles", "[bundle]") {
    TempDir dir;
    DemoBundle demo = build_demo_bundle();
    write_demo_bundle(demo, dir.str());
    
    SECTION("Missing directory") {
        REQUIRE_THROWS_AS(BundleLoader::load((dir.path / "nope").string()), BundleLoadError);
    }
    
    SECTION("Missing manifest") {
        fs::remove(dir.path / "manifest.json");
        REQUIRE_THROWS_AS(BundleLoader::load(dir.str()), BundleLoadError);
    }
    
    SECTION("Corrupt artifact") {
        overwrite(dir.path / "ml" / "xgboost.json", "{\"type\": \"tree_ensemble\", \"trees\": [");
        REQUIRE_THROWS_AS(BundleLoader::load(dir.str()), BundleLoadError);
    }
    
    SECTION("Missing artifact") {
        fs::remove(dir.path / "dl" / "lstm.json");
        REQUIRE_THROWS_AS(BundleLoader::load(dir.str()), BundleLoadError);
    }
    
    SECTION("Model count differs from the expected count") {
        nlohmann::json manifest = demo.manifest;
        manifest["expected_model_count"] = 12;
        REQUIRE_THROWS_AS(BundleLoader::from_manifest(manifest, dir.str()), BundleLoadError);
    }
    
    SECTION("Meta-learner width must match the models") {
        nlohmann::json manifest = demo.manifest;
        manifest["meta_learner"]["coefficients"] = std::vector<double>(12, 1.0);
        manifest["meta_learner"].erase("fallback");
        REQUIRE_THROWS_AS(BundleLoader::from_manifest(manifest, dir.str()), BundleLoadError);
    }
    
    SECTION("Scaler width must match the schema") {
        nlohmann::json manifest = demo.manifest;
        manifest["scalers"]["standard"]["mean"] = std::vector<double>(5, 0.0);
        manifest["scalers"]["standard"]["scale"] = std::vector<double>(5, 1.0);
        REQUIRE_THROWS_AS(BundleLoader::from_manifest(manifest, dir.str()), BundleLoadError);
    }
    
    SECTION("Unknown model type") {
        overwrite(dir.path / "ml" / "catboost.json", R"({"type": "svm", "support_vectors": []})");
        REQUIRE_THROWS_AS(BundleLoader::load(dir.str()), BundleLoadError);
    }
    
    SECTION("Decision bands out of order") {
        nlohmann::json manifest = demo.manifest;
        manifest["decision"]["tier_low"] = 0.8;
        REQUIRE_THROWS_AS(BundleLoader::from_manifest(manifest, dir.str()), BundleLoadError);
    }
}

TEST_CASE("Scorer dispatch", "[bundle]") {
    nlohmann::json linear = {{"type", "linear"}, {"coefficients", {1.0, 2.0}}};
    auto scorer = BundleLoader::make_scorer(linear);
    REQUIRE(scorer->algorithm() == "linear");
    REQUIRE(scorer->input_size() == 2);
    
    nlohmann::json sequence_net = {{"type", "neural_net"}, {"input", {{"layout", "sequence"}}}};
    REQUIRE(BundleLoader::default_attribution(sequence_net) == AttributionMethod::None);
    REQUIRE(BundleLoader::default_attribution(linear) == AttributionMethod::Native);
    
    nlohmann::json unknown = {{"type", "svm"}};
    REQUIRE_THROWS_AS(BundleLoader::make_scorer(unknown), std::invalid_argument);
}
