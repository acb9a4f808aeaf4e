// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "collector.hpp"
#include "stub_remote_client.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>
#include <vector>

namespace prefcol::pipeline::test {

using namespace std::chrono_literals;

namespace {

CollectorConfig manual_config(size_t batch_size = 10) {
    CollectorConfig config;
    config.batch_size = batch_size;
    config.auto_flush = false;
    return config;
}

void expect_stats_balanced(const CollectorStats& s) {
    EXPECT_EQ(s.collected,
              s.submitted + s.rejected_quality + s.rejected_duplicate + s.failed + s.queue_depth);
}

}  // namespace

class CollectorTest : public ::testing::Test {
protected:
    std::shared_ptr<StubRemoteClient> client_ = std::make_shared<StubRemoteClient>();
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(CollectorTest, RequiresClient) {
    EXPECT_THROW(Collector("test", nullptr, manual_config()), std::invalid_argument);
}

TEST_F(CollectorTest, RejectsNonPositiveIntervalWithAutoFlush) {
    CollectorConfig config;
    config.flush_interval = std::chrono::milliseconds(0);
    EXPECT_THROW(Collector("test", client_, config), std::invalid_argument);

    config.flush_interval = std::chrono::milliseconds(-5);
    EXPECT_THROW(Collector("test", client_, config), std::invalid_argument);

    config.auto_flush = false;
    EXPECT_NO_THROW(Collector("test", client_, config));
}

TEST_F(CollectorTest, ZeroBatchSizeBehavesAsOne) {
    Collector collector("test", client_, manual_config(0));
    EXPECT_EQ(collector.config().batch_size, 1u);

    EXPECT_TRUE(collector.submit(make_valid_submission(1)));
    EXPECT_EQ(collector.stats().submitted, 1u);
}

// =============================================================================
// Submission
// =============================================================================

TEST_F(CollectorTest, EndToEndCapitalQuestion) {
    Collector collector("test", client_, manual_config());

    const std::string response_a =
        "Paris is the capital of France, officially designated as such and home to "
        "the national government, parliament and presidency.";
    const std::string response_b =
        "Paris. It has been the French capital for centuries and hosts the government.";

    EXPECT_TRUE(collector.submit("What is the capital of France?", response_a, response_b,
                                 ChosenSide::A, "user42"));

    auto s = collector.stats();
    EXPECT_EQ(s.collected, 1u);
    EXPECT_EQ(s.rejected_quality, 0u);
    EXPECT_EQ(s.queue_depth, 1u);
    EXPECT_TRUE(collector.last_rejection_reason().empty());
}

TEST_F(CollectorTest, DuplicateSubmissionIsRejectedOnce) {
    Collector collector("test", client_, manual_config());
    auto s = make_valid_submission(1);

    EXPECT_TRUE(collector.submit(s));
    auto before = collector.stats().rejected_duplicate;

    EXPECT_FALSE(collector.submit(s));
    EXPECT_EQ(collector.stats().rejected_duplicate, before + 1);
    EXPECT_EQ(collector.last_rejection_reason(), "Duplicate comparison");
}

TEST_F(CollectorTest, LowQualitySubmissionIsCountedAndExplained) {
    Collector collector("test", client_, manual_config());
    auto s = make_valid_submission(1);
    s.prompt = "Hi there";

    EXPECT_FALSE(collector.submit(s));

    auto stats = collector.stats();
    EXPECT_EQ(stats.rejected_quality, 1u);
    EXPECT_EQ(stats.queue_depth, 0u);
    EXPECT_EQ(collector.last_rejection_reason(), "Prompt too short (8 chars)");
}

TEST_F(CollectorTest, QualityRejectionDoesNotPoisonDedupCache) {
    Collector collector("test", client_, manual_config());
    auto s = make_valid_submission(1);
    s.confidence = 2.0;
    EXPECT_FALSE(collector.submit(s));

    s.confidence = 0.8;
    EXPECT_TRUE(collector.submit(s));
}

TEST_F(CollectorTest, DisabledQualityGateAcceptsAnything) {
    auto config = manual_config();
    config.quality_gate_enabled = false;
    Collector collector("test", client_, config);

    EXPECT_TRUE(collector.submit("?", "a", "a", ChosenSide::TIE, "user1"));
    EXPECT_EQ(collector.stats().rejected_quality, 0u);

    // Duplicates are still suppressed
    EXPECT_FALSE(collector.submit("?", "a", "a", ChosenSide::TIE, "user1"));
    EXPECT_EQ(collector.stats().rejected_duplicate, 1u);
}

// =============================================================================
// Flushing
// =============================================================================

TEST_F(CollectorTest, BatchThresholdTriggersFlush) {
    const size_t batch = 5;
    Collector collector("test", client_, manual_config(batch));

    for (size_t i = 0; i < batch - 1; ++i) {
        ASSERT_TRUE(collector.submit(make_valid_submission(static_cast<int>(i))));
    }
    EXPECT_EQ(collector.stats().submitted, 0u);
    EXPECT_EQ(client_->calls(), 0u);

    ASSERT_TRUE(collector.submit(make_valid_submission(static_cast<int>(batch))));

    auto s = collector.stats();
    EXPECT_EQ(s.submitted, batch);
    EXPECT_EQ(s.queue_depth, 0u);
}

TEST_F(CollectorTest, StopDrainsQueue) {
    Collector collector("test", client_, manual_config());
    ASSERT_TRUE(collector.submit(make_valid_submission(1)));
    EXPECT_EQ(collector.stats().submitted, 0u);

    collector.stop();

    EXPECT_EQ(collector.stats().submitted, 1u);
    EXPECT_EQ(collector.stats().queue_depth, 0u);
}

TEST_F(CollectorTest, StopIsIdempotent) {
    Collector collector("test", client_, manual_config());
    collector.submit(make_valid_submission(1));

    collector.stop();
    collector.stop();

    EXPECT_EQ(client_->calls(), 1u);
}

TEST_F(CollectorTest, SubmitAfterStopIsDrainedOnDestruction) {
    {
        Collector collector("test", client_, manual_config());
        collector.stop();

        ASSERT_TRUE(collector.submit(make_valid_submission(1)));
        EXPECT_EQ(collector.stats().queue_depth, 1u);
        EXPECT_EQ(client_->calls(), 0u);
    }

    EXPECT_EQ(client_->calls(), 1u);
}

TEST_F(CollectorTest, RepeatedStopDrainsLateSubmissions) {
    Collector collector("test", client_, manual_config());
    collector.stop();
    ASSERT_TRUE(collector.submit(make_valid_submission(1)));

    collector.stop();

    auto s = collector.stats();
    EXPECT_EQ(s.submitted, 1u);
    EXPECT_EQ(s.queue_depth, 0u);
    expect_stats_balanced(s);
}

TEST_F(CollectorTest, ExplicitFlushOnEmptyQueueSendsNothing) {
    Collector collector("test", client_, manual_config());
    EXPECT_EQ(collector.flush(), 0u);
    EXPECT_EQ(client_->calls(), 0u);
}

TEST_F(CollectorTest, FlushPreservesSubmissionOrder) {
    Collector collector("test", client_, manual_config(100));
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(collector.submit(make_valid_submission(i)));
    }

    EXPECT_EQ(collector.flush(), 5u);

    auto received = client_->received();
    ASSERT_EQ(received.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(received[i].annotator_id, "platform_user" + std::to_string(i));
    }
}

TEST_F(CollectorTest, FailedSendsAreCountedNotRetried) {
    client_->set_mode(StubRemoteClient::Mode::Fail);
    Collector collector("test", client_, manual_config(100));
    collector.submit(make_valid_submission(1));
    collector.submit(make_valid_submission(2));

    EXPECT_EQ(collector.flush(), 0u);

    auto s = collector.stats();
    EXPECT_EQ(s.failed, 2u);
    EXPECT_EQ(s.submitted, 0u);
    EXPECT_EQ(s.queue_depth, 0u);

    client_->set_mode(StubRemoteClient::Mode::Succeed);
    EXPECT_EQ(collector.flush(), 0u);
    EXPECT_EQ(client_->calls(), 2u);
}

TEST_F(CollectorTest, ThrowingClientIsContained) {
    client_->set_mode(StubRemoteClient::Mode::Throw);
    Collector collector("test", client_, manual_config(1));

    EXPECT_NO_THROW(collector.submit(make_valid_submission(1)));
    EXPECT_EQ(collector.stats().failed, 1u);
}

TEST_F(CollectorTest, TimerFlushesWithoutBatchThreshold) {
    CollectorConfig config;
    config.batch_size = 100;
    config.flush_interval = 30ms;
    Collector collector("test", client_, config);

    ASSERT_TRUE(collector.submit(make_valid_submission(1)));

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (collector.stats().submitted == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(collector.stats().submitted, 1u);
}

TEST_F(CollectorTest, BoundedQueueFlushesWhenFull) {
    auto config = manual_config(100);
    config.max_queue_depth = 2;
    Collector collector("test", client_, config);

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(collector.submit(make_valid_submission(i)));
        EXPECT_LE(collector.stats().queue_depth, 2u);
    }

    auto s = collector.stats();
    EXPECT_EQ(s.submitted, 4u);
    EXPECT_EQ(s.queue_depth, 1u);
    expect_stats_balanced(s);
}

// =============================================================================
// Payload shaping
// =============================================================================

TEST_F(CollectorTest, PayloadCarriesNormalizedIdentifiersAndNotes) {
    Collector collector("Defense WM", client_, manual_config(1));

    auto s = make_valid_submission(3);
    s.domain = "ignored";
    s.category = " Scene-Comparison ";
    s.session_id = "sess-9";
    s.confidence = 0.75;
    s.latency_a = 1.25;
    s.context = {{"scene", "harbor"}};
    ASSERT_TRUE(collector.submit(s));

    auto received = client_->received();
    ASSERT_EQ(received.size(), 1u);
    const auto& payload = received[0];

    EXPECT_EQ(payload.domain, "defense_wm");
    EXPECT_EQ(payload.category, "scene_comparison");
    EXPECT_EQ(payload.preference, "A");
    EXPECT_EQ(payload.annotator_id, "platform_user3");
    EXPECT_EQ(payload.prompt, s.prompt);

    auto notes = nlohmann::json::parse(payload.notes);
    EXPECT_EQ(notes["session"], "sess-9");
    EXPECT_DOUBLE_EQ(notes["confidence"].get<double>(), 0.75);
    EXPECT_DOUBLE_EQ(notes["response_time_a"].get<double>(), 1.25);
    EXPECT_EQ(notes["context"]["scene"], "harbor");
    EXPECT_TRUE(notes.contains("timestamp"));
}

// =============================================================================
// Statistics
// =============================================================================

TEST_F(CollectorTest, StatsBalanceAcrossOutcomes) {
    Collector collector("test", client_, manual_config(3));

    collector.submit(make_valid_submission(1));
    collector.submit(make_valid_submission(1));  // duplicate
    auto bad = make_valid_submission(2);
    bad.response_b = "too short";
    collector.submit(bad);
    collector.submit(make_valid_submission(3));
    expect_stats_balanced(collector.stats());

    client_->set_mode(StubRemoteClient::Mode::Fail);
    collector.submit(make_valid_submission(4));  // third queued, flush fails all
    expect_stats_balanced(collector.stats());

    client_->set_mode(StubRemoteClient::Mode::Succeed);
    collector.submit(make_valid_submission(5));
    auto s = collector.stats();
    expect_stats_balanced(s);
    EXPECT_EQ(s.collected, 6u);
    EXPECT_EQ(s.rejected_duplicate, 1u);
    EXPECT_EQ(s.rejected_quality, 1u);
    EXPECT_EQ(s.failed, 3u);
    EXPECT_EQ(s.queue_depth, 1u);

    collector.stop();
    s = collector.stats();
    expect_stats_balanced(s);
    EXPECT_EQ(s.submitted, 1u);
    EXPECT_DOUBLE_EQ(s.acceptance_rate(), 1.0 / 6.0);
}

TEST_F(CollectorTest, AcceptanceRateIsZeroWhenNothingCollected) {
    CollectorStats s;
    EXPECT_DOUBLE_EQ(s.acceptance_rate(), 0.0);
}

TEST_F(CollectorTest, ConcurrentProducersLoseNothing) {
    Collector collector("test", client_, manual_config(7));
    const int producers = 4;
    const int per_producer = 50;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&collector, p] {
            for (int i = 0; i < per_producer; ++i) {
                collector.submit(make_valid_submission(p * per_producer + i));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    collector.stop();

    auto s = collector.stats();
    EXPECT_EQ(s.collected, static_cast<uint64_t>(producers * per_producer));
    EXPECT_EQ(s.submitted, static_cast<uint64_t>(producers * per_producer));
    EXPECT_EQ(client_->calls(), static_cast<size_t>(producers * per_producer));
    expect_stats_balanced(s);
}

}  // namespace prefcol::pipeline::test
