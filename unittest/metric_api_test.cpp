// ============================================================================
// METRIC API UNIT TESTS
// ============================================================================
// Tests for gauges, counters and distributions against a recording backend
// ============================================================================

#include <gtest/gtest.h>
#include <beacon/core/encoding/tag_encoder.hpp>
#include <beacon/core/metrics/metric_api.hpp>
#include "support/fake_backend.hpp"

using namespace Beacon;
using BeaconTest::FakeBackend;
using BeaconTest::MetricCall;
using BeaconTest::activeConfig;
using BeaconTest::fixedSource;

class MetricApiTest : public ::testing::Test {
protected:
    MetricApiTest()
        : lifecycle_(backend_, fixedSource(activeConfig())),
          metrics_(backend_, lifecycle_) {}

    void SetUp() override {
        ASSERT_EQ(lifecycle_.initialize(), LifecycleState::ENABLED_ACTIVE);
    }

    FakeBackend backend_;
    ConfigLifecycle lifecycle_;
    MetricApi metrics_;
};

// ============================================================================
// FORWARDING TESTS
// ============================================================================

TEST_F(MetricApiTest, IntegerAndFloatGaugesAreIdentical) {
    EXPECT_TRUE(metrics_.setGauge("x", 5, {}));
    EXPECT_TRUE(metrics_.setGauge("x", 5.0, {}));

    auto calls = backend_.metricCalls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].method, calls[1].method);
    EXPECT_EQ(calls[0].key, calls[1].key);
    EXPECT_DOUBLE_EQ(calls[0].value, calls[1].value);
    EXPECT_EQ(calls[0].tags, calls[1].tags);
}

TEST_F(MetricApiTest, CounterDefaultsToOne) {
    EXPECT_TRUE(metrics_.incrementCounter("requests"));
    EXPECT_TRUE(metrics_.incrementCounter("requests", 3));

    auto calls = backend_.metricCalls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].method, "incrementCounter");
    EXPECT_DOUBLE_EQ(calls[0].value, 1.0);
    EXPECT_DOUBLE_EQ(calls[1].value, 3.0);
}

TEST_F(MetricApiTest, DistributionForwardsEncodedTags) {
    TagSet tags = {{"env", "prod"}, {"n", 3}};
    EXPECT_TRUE(metrics_.addDistributionValue("latency_ms", 12.5, tags));

    auto calls = backend_.metricCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].method, "addDistributionValue");
    EXPECT_EQ(calls[0].key, "latency_ms");
    EXPECT_DOUBLE_EQ(calls[0].value, 12.5);
    EXPECT_EQ(TagEncoder::decode(calls[0].tags), tags);
}

TEST_F(MetricApiTest, EmptyTagsAreEncodedAsEmptyStructure) {
    metrics_.setGauge("x", 1);

    auto calls = backend_.metricCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].tags, TagEncoder::encode(TagSet{}));
}

TEST_F(MetricApiTest, EmptyKeyIsDropped) {
    EXPECT_TRUE(metrics_.setGauge("", 1));
    EXPECT_EQ(backend_.callCount(), 0u);
}

// ============================================================================
// FAILURE ABSORPTION TESTS
// ============================================================================

TEST_F(MetricApiTest, BackendRejectionIsAbsorbed) {
    backend_.accept = false;

    EXPECT_TRUE(metrics_.setGauge("x", 1));
    EXPECT_TRUE(metrics_.incrementCounter("y"));
    EXPECT_EQ(metrics_.failedCount(), 2u);
}

TEST_F(MetricApiTest, BackendExceptionIsAbsorbed) {
    backend_.throw_on_call = true;

    bool result = false;
    EXPECT_NO_THROW(result = metrics_.addDistributionValue("x", 1.5));
    EXPECT_TRUE(result);
    EXPECT_EQ(metrics_.failedCount(), 1u);
}

TEST_F(MetricApiTest, NonStandardBackendExceptionIsAbsorbed) {
    backend_.throw_int_on_call = true;

    bool result = false;
    EXPECT_NO_THROW(result = metrics_.setGauge("x", 1));
    EXPECT_TRUE(result);
    EXPECT_EQ(metrics_.failedCount(), 1u);
}

// ============================================================================
// INACTIVE LIFECYCLE TESTS
// ============================================================================

TEST(MetricApi, FailedLifecycleNeverContactsBackend) {
    AgentConfig config = activeConfig();
    config.push_api_key.clear();

    FakeBackend backend;
    ConfigLifecycle lifecycle(backend, fixedSource(config));
    ASSERT_EQ(lifecycle.initialize(), LifecycleState::ENABLED_FAILED);
    MetricApi metrics(backend, lifecycle);

    EXPECT_TRUE(metrics.setGauge("x", 5));
    EXPECT_TRUE(metrics.incrementCounter("x"));
    EXPECT_TRUE(metrics.addDistributionValue("x", 0.5));
    EXPECT_EQ(backend.callCount(), 0u);
}

TEST(MetricApi, UninitializedLifecycleNeverContactsBackend) {
    FakeBackend backend;
    ConfigLifecycle lifecycle(backend, fixedSource(activeConfig()));
    MetricApi metrics(backend, lifecycle);

    EXPECT_TRUE(metrics.setGauge("x", 5));
    EXPECT_EQ(backend.callCount(), 0u);
}

TEST(MetricApi, StoppedLifecycleNeverContactsBackend) {
    FakeBackend backend;
    ConfigLifecycle lifecycle(backend, fixedSource(activeConfig()));
    lifecycle.initialize();
    lifecycle.stop();
    MetricApi metrics(backend, lifecycle);

    EXPECT_TRUE(metrics.incrementCounter("x", 2));
    EXPECT_EQ(backend.callCount(), 0u);
}
