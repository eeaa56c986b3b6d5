#include <gtest/gtest.h>
#include "steward/progress_aggregator.h"
#include "test_fakes.h"

using namespace steward;
using steward::testing::make_record;

// A second layer appearing late grows the total, so the raw percent dips
TEST(ProgressAggregatorTest, NewLayerGrowsTotal) {
    ProgressAggregator aggregator;

    AggregateProgress p = aggregator.update("a", 50, 100);
    EXPECT_EQ(p.percent, 50);
    EXPECT_EQ(p.display_percent, 50);

    p = aggregator.update("b", 0, 100);
    EXPECT_EQ(p.completed, 50u);
    EXPECT_EQ(p.total, 200u);
    EXPECT_EQ(p.percent, 25);
    EXPECT_EQ(p.display_percent, 50);

    aggregator.update("a", 100, 100);
    p = aggregator.update("b", 100, 100);
    EXPECT_EQ(p.percent, 100);
    EXPECT_EQ(p.display_percent, 100);
    EXPECT_EQ(aggregator.layers().size(), 2u);
}

// The displayed value never decreases within one attempt
TEST(ProgressAggregatorTest, DisplayPercentIsMonotonic) {
    ProgressAggregator aggregator;
    int previous = 0;

    aggregator.update("a", 10, 100);
    for (int i = 0; i < 5; ++i) {
        aggregator.update("layer" + std::to_string(i), 0, 1000);
        aggregator.update("a", 10 + i * 20, 100);
        EXPECT_GE(aggregator.current().display_percent, previous);
        previous = aggregator.current().display_percent;
    }
}

// A verifying status pins the aggregate to 100 regardless of byte counts
TEST(ProgressAggregatorTest, VerifyingPinsToHundred) {
    ProgressAggregator aggregator;
    aggregator.update(make_record("pulling abc", "sha256:abc", 30, 100));

    AggregateProgress p = aggregator.update(make_record("verifying sha256 digest", "", 0, 0, false));
    EXPECT_EQ(p.phase, TransferPhase::Verifying);
    EXPECT_EQ(p.percent, 100);
    EXPECT_EQ(p.display_percent, 100);
    EXPECT_TRUE(aggregator.pinned());

    // Later byte updates do not unpin
    p = aggregator.update(make_record("pulling abc", "sha256:abc", 40, 100));
    EXPECT_EQ(p.percent, 100);
    EXPECT_EQ(p.phase, TransferPhase::Verifying);

    p = aggregator.update(make_record("writing manifest", "", 0, 0, false));
    EXPECT_EQ(p.phase, TransferPhase::Finalizing);
    EXPECT_EQ(p.percent, 100);
}

// Records without a digest are tracked under a single unlabeled layer
TEST(ProgressAggregatorTest, RecordsWithoutDigestShareUnknownLayer) {
    ProgressAggregator aggregator;
    aggregator.update(make_record("downloading", "", 10, 100));
    aggregator.update(make_record("downloading", "", 60, 100));

    ASSERT_EQ(aggregator.layers().size(), 1u);
    EXPECT_EQ(aggregator.layers().begin()->first, UNKNOWN_LAYER_ID);
    EXPECT_EQ(aggregator.current().percent, 60);
}

// Status-only records change the phase without touching the byte counters
TEST(ProgressAggregatorTest, StatusOnlyRecordKeepsCounters) {
    ProgressAggregator aggregator;
    aggregator.update(make_record("downloading", "", 40, 100));

    AggregateProgress p = aggregator.update(make_record("pulling manifest", "", 0, 0, false));
    EXPECT_EQ(p.completed, 40u);
    EXPECT_EQ(p.total, 100u);
    EXPECT_EQ(p.percent, 40);
    EXPECT_EQ(p.phase, TransferPhase::Transferring);
}

// Nothing known yet means zero percent, not a division by zero
TEST(ProgressAggregatorTest, EmptyTotalIsZeroPercent) {
    ProgressAggregator aggregator;
    EXPECT_EQ(aggregator.current().phase, TransferPhase::Pending);

    AggregateProgress p = aggregator.update("a", 0, 0);
    EXPECT_EQ(p.percent, 0);
    EXPECT_EQ(p.phase, TransferPhase::Transferring);
}

// Percent is rounded and capped at 100 even when a layer over-reports
TEST(ProgressAggregatorTest, PercentRoundedAndCapped) {
    ProgressAggregator aggregator;
    EXPECT_EQ(aggregator.update("a", 2, 3).percent, 67);
    EXPECT_EQ(aggregator.update("a", 150, 100).percent, 100);
}

TEST(TransferTypesTest, PhaseFromStatus) {
    EXPECT_EQ(phase_from_status("pulling manifest"), TransferPhase::Transferring);
    EXPECT_EQ(phase_from_status("pulling 6a0746a1ec1a"), TransferPhase::Transferring);
    EXPECT_EQ(phase_from_status("Verifying sha256 digest"), TransferPhase::Verifying);
    EXPECT_EQ(phase_from_status("writing manifest"), TransferPhase::Finalizing);
    EXPECT_EQ(phase_from_status("removing any unused layers"), TransferPhase::Finalizing);
    EXPECT_EQ(phase_from_status("success"), TransferPhase::Finalizing);
}

TEST(TransferTypesTest, RecordFromJson) {
    auto record = ProgressRecord::from_json(json::parse(
        R"({"status":"pulling abc","digest":"sha256:abc","completed":5,"total":10})"));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, "pulling abc");
    EXPECT_EQ(record->digest, "sha256:abc");
    EXPECT_EQ(record->completed, 5u);
    EXPECT_EQ(record->total, 10u);
    EXPECT_TRUE(record->has_bytes);
    EXPECT_FALSE(record->has_error);

    auto status_only = ProgressRecord::from_json(json::parse(R"({"status":"pulling manifest"})"));
    ASSERT_TRUE(status_only.has_value());
    EXPECT_FALSE(status_only->has_bytes);

    auto error = ProgressRecord::from_json(json::parse(R"({"error":"pull model manifest: file does not exist"})"));
    ASSERT_TRUE(error.has_value());
    EXPECT_TRUE(error->has_error);
    EXPECT_EQ(error->error, "pull model manifest: file does not exist");

    EXPECT_FALSE(ProgressRecord::from_json(json::parse(R"({"status":42})")).has_value());
    EXPECT_FALSE(ProgressRecord::from_json(json::parse(R"({"completed":"lots"})")).has_value());
    EXPECT_FALSE(ProgressRecord::from_json(json::parse("[1,2]")).has_value());
}

// An error record survives whatever its status field holds
TEST(TransferTypesTest, ErrorWinsOverBadStatus) {
    auto null_status = ProgressRecord::from_json(json::parse(R"({"error":"x","status":null})"));
    ASSERT_TRUE(null_status.has_value());
    EXPECT_TRUE(null_status->has_error);
    EXPECT_EQ(null_status->error, "x");
    EXPECT_EQ(null_status->status, "");

    auto numeric_status = ProgressRecord::from_json(json::parse(R"({"error":"disk full","status":500})"));
    ASSERT_TRUE(numeric_status.has_value());
    EXPECT_TRUE(numeric_status->has_error);

    EXPECT_FALSE(ProgressRecord::from_json(json::parse(R"({"status":null})")).has_value());
}
