#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/scaling.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Standard scaler", "[scaling]") {
    StandardScaler scaler({10.0, 0.0, -2.0}, {2.0, 0.0, 0.5});
    
    SECTION("Centres and scales each feature") {
        auto z = scaler.transform({14.0, 3.0, -1.0});
        REQUIRE_THAT(z[0], WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(z[2], WithinAbs(2.0, 1e-12));
    }
    
    SECTION("Zero scale is treated as one") {
        auto z = scaler.transform({10.0, 3.0, -2.0});
        REQUIRE_THAT(z[1], WithinAbs(3.0, 1e-12));
    }
    
    SECTION("Inverse transform reproduces the input") {
        std::vector<double> x = {123.456, -7.5, 1e-3};
        auto back = scaler.inverse_transform(scaler.transform(x));
        for (size_t i = 0; i < x.size(); ++i) {
            REQUIRE_THAT(back[i], WithinAbs(x[i], 1e-9));
        }
    }
    
    SECTION("Wrong input size throws") {
        REQUIRE_THROWS_AS(scaler.transform({1.0}), std::invalid_argument);
    }
}

TEST_CASE("Min-max scaler", "[scaling]") {
    SECTION("Maps into the fitted range without clipping by default") {
        MinMaxScaler scaler({0.0, 5.0}, {10.0, 5.0});
        auto u = scaler.transform({5.0, 5.0});
        REQUIRE_THAT(u[0], WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(u[1], WithinAbs(0.0, 1e-12));
        
        auto out = scaler.transform({20.0, 5.0});
        REQUIRE_THAT(out[0], WithinAbs(2.0, 1e-12));
    }
    
    SECTION("Clips when configured") {
        MinMaxScaler scaler({0.0}, {10.0}, 0.0, 1.0, true);
        REQUIRE_THAT(scaler.transform({-5.0})[0], WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(scaler.transform({15.0})[0], WithinAbs(1.0, 1e-12));
    }
    
    SECTION("Custom feature range and inverse") {
        MinMaxScaler scaler({-1.0, 2.0}, {1.0, 6.0}, -1.0, 1.0);
        std::vector<double> x = {0.25, 5.0};
        auto back = scaler.inverse_transform(scaler.transform(x));
        REQUIRE_THAT(back[0], WithinAbs(0.25, 1e-12));
        REQUIRE_THAT(back[1], WithinAbs(5.0, 1e-12));
    }
    
    SECTION("Rejects inverted bounds") {
        REQUIRE_THROWS_AS(MinMaxScaler({1.0}, {0.0}), std::invalid_argument);
    }
}

TEST_CASE("Scaling policy", "[scaling]") {
    ScalingPolicy policy;
    policy.set_standard(StandardScaler({1.0, 1.0}, {1.0, 1.0}));
    FeatureVector fv{{2.0, 3.0}};
    
    SECTION("Produces only the requested variants") {
        auto views = policy.apply(fv, {ScalingVariant::Standard});
        REQUIRE(views.has_standard);
        REQUIRE_FALSE(views.has_minmax);
        REQUIRE(views.view(ScalingVariant::Raw) == fv.values);
        REQUIRE(views.view(ScalingVariant::Standard) == std::vector<double>{1.0, 2.0});
        REQUIRE_THROWS_AS(views.view(ScalingVariant::MinMax), std::logic_error);
    }
    
    SECTION("Missing scaler is reported") {
        REQUIRE_FALSE(policy.supports(ScalingVariant::MinMax));
        REQUIRE_THROWS_AS(policy.apply(fv, {ScalingVariant::MinMax}), std::logic_error);
    }
    
    SECTION("Variant names") {
        REQUIRE(scaling_variant_from_string("none") == ScalingVariant::Raw);
        REQUIRE(scaling_variant_string(ScalingVariant::MinMax) == "minmax");
        REQUIRE_THROWS_AS(scaling_variant_from_string("robust"), std::invalid_argument);
    }
}
