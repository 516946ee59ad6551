#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <memory>
#include <thread>
#include <vector>
#include "errors.hpp"
#include "pipeline.hpp"
#include "test_support.hpp"

TEST(SelectVariantTest, NoCanaryAlwaysStable) {
    for (double u : {0.0, 0.05, 0.099, 0.5, 0.999}) {
        EXPECT_EQ(select_variant(false, u), Variant::Stable);
    }
}

TEST(SelectVariantTest, CanaryShareBoundary) {
    EXPECT_EQ(select_variant(true, 0.0), Variant::Canary);
    EXPECT_EQ(select_variant(true, 0.0999), Variant::Canary);
    EXPECT_EQ(select_variant(true, 0.10), Variant::Stable);
    EXPECT_EQ(select_variant(true, 0.75), Variant::Stable);
}

TEST(RandomSourceTest, SeededSequenceIsReproducible) {
    SeededRandomSource a(7), b(7);
    for (int i = 0; i < 100; ++i) {
        const double x = a.uniform();
        EXPECT_DOUBLE_EQ(x, b.uniform());
        EXPECT_GE(x, 0.0);
        EXPECT_LT(x, 1.0);
    }
}

TEST(RandomSourceTest, ThreadLocalSourceStaysInRange) {
    ThreadLocalRandomSource rng;
    for (int i = 0; i < 1000; ++i) {
        const double x = rng.uniform();
        EXPECT_GE(x, 0.0);
        EXPECT_LT(x, 1.0);
    }
}

TEST(TrafficRouterTest, DoesNotDrawWithoutCanary) {
    ScriptedRandomSource rng;
    TrafficRouter router(rng);
    for (int i = 0; i < 10; ++i) EXPECT_EQ(router.route(false), Variant::Stable);
    EXPECT_EQ(rng.draws(), 0);
}

class PredictionPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        stable_model = std::make_shared<StubModel>(0.25, 5, "v1",
                                                   [this] { clock.advance_ms(2.0); });
        canary_model = std::make_shared<StubModel>(0.75, 5, "v2",
                                                   [this] { clock.advance_ms(2.0); });
        loader.add("models/v1", stable_model);
        loader.add("models/v2", canary_model);
        state = std::make_unique<DeploymentStateMachine>(loader, recorder, "models/v1");
    }

    std::unique_ptr<PredictionPipeline> makePipeline(RandomSource& rng) {
        return std::make_unique<PredictionPipeline>(*state, recorder, rng, clock.hooks());
    }

    ManualClock clock;
    InMemoryLoader loader;
    LatencyRecorder recorder;
    std::shared_ptr<StubModel> stable_model;
    std::shared_ptr<StubModel> canary_model;
    std::unique_ptr<DeploymentStateMachine> state;
};

TEST_F(PredictionPipelineTest, AllStableWithoutCanary) {
    SeededRandomSource rng(99);
    auto pipeline = makePipeline(rng);
    for (int i = 0; i < 500; ++i) {
        PredictionResult r = pipeline->predict(sample_features());
        EXPECT_EQ(r.variant, Variant::Stable);
        EXPECT_DOUBLE_EQ(r.probability, 0.25);
    }
    EXPECT_EQ(recorder.count(Variant::Stable), 500u);
    EXPECT_EQ(recorder.count(Variant::Canary), 0u);
}

TEST_F(PredictionPipelineTest, CanaryShareConvergesToTenPercent) {
    SeededRandomSource rng(42);
    auto pipeline = makePipeline(rng);
    state->deploy_canary("models/v2");

    const int n = 2000;
    int canary = 0;
    for (int i = 0; i < n; ++i) {
        PredictionResult r = pipeline->predict(sample_features());
        if (r.variant == Variant::Canary) {
            canary++;
            EXPECT_DOUBLE_EQ(r.probability, 0.75);
        } else {
            EXPECT_DOUBLE_EQ(r.probability, 0.25);
        }
    }
    const double share = static_cast<double>(canary) / n;
    EXPECT_NEAR(share, 0.10, 0.03);
    EXPECT_EQ(recorder.count(Variant::Canary), static_cast<size_t>(canary));
    EXPECT_EQ(recorder.count(Variant::Stable), static_cast<size_t>(n - canary));
}

TEST_F(PredictionPipelineTest, LatencyIsMeasuredAroundModelCall) {
    ScriptedRandomSource rng;
    auto pipeline = makePipeline(rng);
    PredictionResult r = pipeline->predict(sample_features());
    EXPECT_DOUBLE_EQ(r.latency_ms, 2.0);
    EXPECT_EQ(recorder.snapshot(Variant::Stable), (std::vector<double>{2.0}));
}

TEST_F(PredictionPipelineTest, SlowdownOnlyAffectsCanaryAndIsTimed) {
    ScriptedRandomSource rng;  // canary on draws 0, 10, 20, ...
    auto pipeline = makePipeline(rng);
    state->deploy_canary("models/v2");
    state->toggle_slowdown();

    for (int i = 0; i < 20; ++i) {
        PredictionResult r = pipeline->predict(sample_features());
        if (i % 10 == 0) {
            EXPECT_EQ(r.variant, Variant::Canary);
            EXPECT_DOUBLE_EQ(r.latency_ms, 12.0);
        } else {
            EXPECT_EQ(r.variant, Variant::Stable);
            EXPECT_DOUBLE_EQ(r.latency_ms, 2.0);
        }
    }
    EXPECT_EQ(recorder.snapshot(Variant::Canary), (std::vector<double>{12.0, 12.0}));
}

TEST_F(PredictionPipelineTest, SlowdownWithoutCanaryChangesNothing) {
    ScriptedRandomSource rng;
    auto pipeline = makePipeline(rng);
    state->toggle_slowdown();
    PredictionResult r = pipeline->predict(sample_features());
    EXPECT_EQ(r.variant, Variant::Stable);
    EXPECT_DOUBLE_EQ(r.latency_ms, 2.0);
}

TEST_F(PredictionPipelineTest, MalformedFeaturesAreRejectedWithoutRecording) {
    ScriptedRandomSource rng;
    auto pipeline = makePipeline(rng);

    EXPECT_THROW(pipeline->predict({}), InvalidInputError);
    EXPECT_THROW(pipeline->predict({1.0, 2.0}), InvalidInputError);
    EXPECT_THROW(pipeline->predict({1.0, NAN, 0.0, 0.0, 0.0}), InvalidInputError);
    EXPECT_THROW(pipeline->predict({1.0, INFINITY, 0.0, 0.0, 0.0}), InvalidInputError);

    EXPECT_EQ(recorder.count(Variant::Stable), 0u);
    EXPECT_EQ(recorder.count(Variant::Canary), 0u);
}

TEST_F(PredictionPipelineTest, SampleFromReplacedCanaryIsDropped) {
    // The canary is rolled back and a new one deployed while a request to it is in flight.
    loader.add("models/v2-replaced", std::make_shared<StubModel>(0.75, 5, "v2", [this] {
        state->rollback_canary();
        state->deploy_canary("models/v3");
        clock.advance_ms(50.0);
    }));
    loader.add("models/v3", std::make_shared<StubModel>(0.60, 5, "v3",
                                                        [this] { clock.advance_ms(3.0); }));
    ScriptedRandomSource rng(1);  // every request goes to the canary
    auto pipeline = makePipeline(rng);
    state->deploy_canary("models/v2-replaced");

    PredictionResult r = pipeline->predict(sample_features());
    EXPECT_EQ(r.variant, Variant::Canary);
    EXPECT_DOUBLE_EQ(r.probability, 0.75);
    EXPECT_DOUBLE_EQ(r.latency_ms, 50.0);
    EXPECT_EQ(state->snapshot().canary_path, "models/v3");
    EXPECT_EQ(recorder.count(Variant::Canary), 0u);
    EXPECT_EQ(recorder.count(Variant::Stable), 0u);

    r = pipeline->predict(sample_features());
    EXPECT_DOUBLE_EQ(r.probability, 0.60);
    EXPECT_EQ(recorder.snapshot(Variant::Canary), (std::vector<double>{3.0}));
}

TEST(PredictionPipelineEpisodeTest, StableSampleStraddlingDeployIsDropped) {
    ManualClock clock;
    InMemoryLoader loader;
    LatencyRecorder recorder;
    std::unique_ptr<DeploymentStateMachine> state;
    bool deployed = false;
    loader.add("models/v1", std::make_shared<StubModel>(0.25, 5, "v1", [&] {
        if (!deployed) {
            deployed = true;
            state->deploy_canary("models/v2");
        }
        clock.advance_ms(2.0);
    }));
    loader.add("models/v2", std::make_shared<StubModel>(0.75, 5, "v2"));
    state = std::make_unique<DeploymentStateMachine>(loader, recorder, "models/v1");
    ScriptedRandomSource rng(1000);  // only the first draw of a canary episode hits the canary
    PredictionPipeline pipeline(*state, recorder, rng, clock.hooks());

    PredictionResult r = pipeline.predict(sample_features());
    EXPECT_EQ(r.variant, Variant::Stable);
    EXPECT_EQ(state->phase(), DeploymentPhase::CanaryActive);
    EXPECT_EQ(recorder.count(Variant::Stable), 0u);
}

TEST(PredictionPipelineConcurrencyTest, ConcurrentPredictionsAndAdminTransitions) {
    InMemoryLoader loader;
    loader.add("models/v1", std::make_shared<StubModel>(0.25, 5, "v1"));
    loader.add("models/v2", std::make_shared<StubModel>(0.75, 5, "v2"));
    LatencyRecorder recorder;
    DeploymentStateMachine state(loader, recorder, "models/v1");
    ThreadLocalRandomSource rng;
    PredictionPipeline pipeline(state, recorder, rng);

    std::atomic<bool> stop{false};
    std::atomic<int> predictions{0};
    std::atomic<int> bad_probability{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&]() {
            while (!stop.load()) {
                PredictionResult r = pipeline.predict(sample_features());
                const double expected = r.variant == Variant::Canary ? 0.75 : 0.25;
                if (r.probability != expected) bad_probability++;
                predictions++;
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        state.deploy_canary("models/v2");
        state.toggle_slowdown();
        state.rollback_canary();
        state.toggle_slowdown();
    }
    stop = true;
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_GT(predictions.load(), 0);
    EXPECT_EQ(bad_probability.load(), 0);
    EXPECT_EQ(state.phase(), DeploymentPhase::NoCanary);
}
