#include <gtest/gtest.h>

#include "queue/hold_registry.h"

using namespace Wipflow;

class HoldRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* id : {"A", "B", "C"}) {
            NewEntry entry;
            entry.order_id = id;
            entry.factory_id = "F1";
            store_.Enqueue(Stage::kPreInspection, entry, 0);
        }
    }

    InMemoryQueueStore store_;
    HoldRegistry holds_{&store_};
};

TEST_F(HoldRegistryTest, SetHoldRecordsReasonAndCount) {
    auto held = holds_.SetHold(Stage::kPreInspection, "A", 50, "capacity", 30);
    ASSERT_TRUE(held.ok()) << held.status();
    EXPECT_EQ(held->hold_until_sim_minute, 50);
    EXPECT_EQ(held->hold_reason, "capacity");
    EXPECT_EQ(held->hold_set_at_sim_minute, 30);
    EXPECT_EQ(held->hold_count, 1);

    // Overwrite
    held = holds_.SetHold(Stage::kPreInspection, "A", 80, "material", 40);
    ASSERT_TRUE(held.ok());
    EXPECT_EQ(held->hold_until_sim_minute, 80);
    EXPECT_EQ(held->hold_reason, "material");
    EXPECT_EQ(held->hold_count, 2);
}

TEST_F(HoldRegistryTest, SetHoldValidatesInput) {
    EXPECT_TRUE(absl::IsInvalidArgument(holds_.SetHold(Stage::kPreInspection, "A", 50, "", 0).status()));
    EXPECT_TRUE(absl::IsInvalidArgument(holds_.SetHold(Stage::kPreInspection, "", 50, "capacity", 0).status()));
    EXPECT_TRUE(absl::IsNotFound(holds_.SetHold(Stage::kPreInspection, "Z", 50, "capacity", 0).status()));
    EXPECT_TRUE(absl::IsNotFound(holds_.SetHold(Stage::kPreAcceptance, "A", 50, "capacity", 0).status()));
}

TEST_F(HoldRegistryTest, ClearHoldKeepsCount) {
    ASSERT_TRUE(holds_.SetHold(Stage::kPreInspection, "B", 50, "capacity", 0).ok());
    auto cleared = holds_.ClearHold(Stage::kPreInspection, "B");
    ASSERT_TRUE(cleared.ok());
    EXPECT_FALSE(cleared->hold_until_sim_minute.has_value());
    EXPECT_FALSE(cleared->hold_reason.has_value());
    EXPECT_FALSE(cleared->hold_set_at_sim_minute.has_value());
    EXPECT_EQ(cleared->hold_count, 1);
}

TEST_F(HoldRegistryTest, SetMultipleIsBestEffort) {
    std::vector<HoldRequest> requests = {
        {"A", 60, "capacity"},
        {"missing", 60, "capacity"},
        {"C", 60, ""},
        {"B", 70, "quality"},
    };
    MultiHoldResult result = holds_.SetMultiple(Stage::kPreInspection, requests, 10);
    EXPECT_EQ(result.successful, 2u);
    ASSERT_EQ(result.items.size(), 4u);
    EXPECT_TRUE(result.items[0].status.ok());
    EXPECT_TRUE(absl::IsNotFound(result.items[1].status));
    EXPECT_TRUE(absl::IsInvalidArgument(result.items[2].status));
    EXPECT_TRUE(result.items[3].status.ok());
    EXPECT_FALSE(store_.Find(Stage::kPreInspection, "C")->hold_until_sim_minute.has_value());
}

TEST_F(HoldRegistryTest, PartitionSeparatesActiveAndExpiredHolds) {
    ASSERT_TRUE(holds_.SetHold(Stage::kPreInspection, "A", 50, "capacity", 0).ok());
    ASSERT_TRUE(holds_.SetHold(Stage::kPreInspection, "B", 20, "material", 0).ok());

    HoldPartition partition = holds_.PartitionEligible(Stage::kPreInspection,
            store_.ListPending(Stage::kPreInspection), 20);

    ASSERT_EQ(partition.on_hold.size(), 1u);
    EXPECT_EQ(partition.on_hold[0].order_id, "A");
    ASSERT_EQ(partition.eligible.size(), 2u);
    EXPECT_EQ(partition.eligible[0].order_id, "B");
    EXPECT_EQ(partition.eligible[1].order_id, "C");
    EXPECT_EQ(partition.cleared, 1u);

    // The expired hold is cleared in the store, the active one is kept
    EXPECT_FALSE(store_.Find(Stage::kPreInspection, "B")->hold_until_sim_minute.has_value());
    EXPECT_EQ(store_.Find(Stage::kPreInspection, "B")->hold_count, 1);
    EXPECT_EQ(store_.Find(Stage::kPreInspection, "A")->hold_until_sim_minute, 50);
}

TEST_F(HoldRegistryTest, HoldExpiresExactlyAtHoldUntil) {
    ASSERT_TRUE(holds_.SetHold(Stage::kPreInspection, "A", 50, "capacity", 30).ok());
    auto entry = store_.Find(Stage::kPreInspection, "A");
    EXPECT_TRUE(entry->HasActiveHold(49));
    EXPECT_FALSE(entry->HasActiveHold(50));
    EXPECT_TRUE(entry->HasExpiredHold(50));
}
