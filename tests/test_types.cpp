#include <gtest/gtest.h>
#include <string>
#include "types.hpp"
#include "errors.hpp"
#include "deployment_state.hpp"

TEST(VariantTest, Names) {
    EXPECT_STREQ(variant_name(Variant::Stable), "stable");
    EXPECT_STREQ(variant_name(Variant::Canary), "canary");
}

TEST(VariantTest, PhaseNames) {
    EXPECT_STREQ(phase_name(DeploymentPhase::NoCanary), "NO_CANARY");
    EXPECT_STREQ(phase_name(DeploymentPhase::CanaryActive), "CANARY_ACTIVE");
}

TEST(RolloutPolicyTest, FixedConstants) {
    EXPECT_DOUBLE_EQ(kCanaryTrafficFraction, 0.10);
    EXPECT_EQ(kSimulatedSlowdown.count(), 10);
    EXPECT_EQ(kMinHealthSamples, 20u);
    EXPECT_DOUBLE_EQ(kSignificanceAlpha, 0.05);
    // Power analysis recommends more than the enforced gate.
    EXPECT_GT(kRecommendedHealthSamples, kMinHealthSamples);
}

TEST(HealthCheckResultTest, DefaultConstruction) {
    HealthCheckResult r{};
    EXPECT_FALSE(r.alert);
    EXPECT_FALSE(r.sufficient_data);
    EXPECT_DOUBLE_EQ(r.p_value, 1.0);
    EXPECT_EQ(r.stable_count, 0u);
    EXPECT_EQ(r.canary_count, 0u);
    EXPECT_TRUE(r.message.empty());
}

TEST(PredictionResultTest, DefaultConstruction) {
    PredictionResult r{};
    EXPECT_EQ(r.variant, Variant::Stable);
    EXPECT_DOUBLE_EQ(r.probability, 0.0);
    EXPECT_DOUBLE_EQ(r.latency_ms, 0.0);
}

TEST(ErrorTaxonomyTest, KindsAndHierarchy) {
    InvalidStateError s("no canary");
    ModelLoadError l("models/x.yaml", "file not found", true);
    InvalidInputError i("bad");

    EXPECT_STREQ(s.kind(), "invalid_state");
    EXPECT_STREQ(l.kind(), "model_load");
    EXPECT_STREQ(i.kind(), "invalid_input");

    const CanaryError& base = l;
    EXPECT_NE(std::string(base.what()).find("models/x.yaml"), std::string::npos);
    EXPECT_TRUE(l.not_found());
    EXPECT_EQ(l.path(), "models/x.yaml");

    EXPECT_THROW(throw InvalidStateError("x"), std::runtime_error);
}
