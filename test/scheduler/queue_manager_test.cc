#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <functional>
#include <stdexcept>
#include <thread>

#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"

#include "scheduler/pipeline_fixture.h"

using namespace Wipflow;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Invoke;
using ::testing::Return;

namespace {

wipflow::OptimizerResponse Ranked(const std::vector<std::string>& ids) {
    wipflow::OptimizerResponse response;
    for (const std::string& id : ids) response.add_release_list(id);
    return response;
}

// Accepts every enqueue but fails to persist a release
class FailingCommitStore : public InMemoryQueueStore {
public:
    absl::Status CommitRelease(Stage, const ReleaseCommit&) override {
        return absl::UnavailableError("database connection lost");
    }
};

// Runs a one-shot hook inside CommitRelease, before the release is persisted
class HookedCommitStore : public InMemoryQueueStore {
public:
    absl::Status CommitRelease(Stage stage, const ReleaseCommit& commit) override {
        if (before_commit) {
            std::function<void()> hook = std::move(before_commit);
            before_commit = nullptr;
            hook();
        }
        return InMemoryQueueStore::CommitRelease(stage, commit);
    }

    std::function<void()> before_commit;
};

} // namespace

class QueueManagerTest : public PipelineFixture {
protected:
    void SetUp() override {
        PipelineFixture::SetUp();
        AddOrders({"A", "B", "C"});
    }
};

//----------------------------------------------------------------------------
// Registration and enqueue
//----------------------------------------------------------------------------

TEST_F(QueueManagerTest, EnqueueRequiresKnownOrder) {
    auto result = manager_->Enqueue(Stage::kPreAcceptance, "missing", 0);
    EXPECT_TRUE(absl::IsNotFound(result.status()));

    OrderInfo order;
    order.order_id = "X";
    order.factory_id = "F9";
    EXPECT_TRUE(absl::IsNotFound(manager_->RegisterOrder(order)));
}

TEST_F(QueueManagerTest, EnqueueFallsBackToOrderPayload) {
    OrderInfo order;
    order.order_id = "P";
    order.factory_id = "F1";
    order.possible_sequence = R"({"steps": ["PS-1"]})";
    order.process_times = R"({"PS-1": 12})";
    ASSERT_TRUE(manager_->RegisterOrder(order).ok());

    auto defaulted = manager_->Enqueue(Stage::kPreAcceptance, "P", 0);
    ASSERT_TRUE(defaulted.ok());
    EXPECT_EQ(defaulted->entry.possible_sequence, order.possible_sequence);
    EXPECT_EQ(defaulted->entry.process_times, order.process_times);

    auto explicit_payload = manager_->Enqueue(Stage::kPreInspection, "P", 0, std::string("[]"), std::string("{}"));
    ASSERT_TRUE(explicit_payload.ok());
    EXPECT_EQ(explicit_payload->entry.possible_sequence, "[]");
    EXPECT_EQ(explicit_payload->entry.process_times, "{}");
}

TEST_F(QueueManagerTest, DuplicateEnqueueIsIdempotent) {
    SetReleaseMinutes(Stage::kPreInspection, 30);
    auto first = manager_->Enqueue(Stage::kPreInspection, "A", 0);
    auto second = manager_->Enqueue(Stage::kPreInspection, "A", 5);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_FALSE(first->skipped);
    EXPECT_TRUE(first->window_opened);
    EXPECT_TRUE(second->skipped);
    EXPECT_FALSE(second->window_opened);
    EXPECT_EQ(second->entry.id, first->entry.id);
    EXPECT_EQ(first->entry.release_after_minutes, 30);
    EXPECT_EQ(PendingIds(Stage::kPreInspection).size(), 1u);
}

//----------------------------------------------------------------------------
// ReleaseNext
//----------------------------------------------------------------------------

TEST_F(QueueManagerTest, ReleaseNextOnEmptyQueue) {
    auto result = manager_->ReleaseNext(Stage::kPreInspection, 0);
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result->released);
    EXPECT_EQ(result->message, "Queue is empty");
}

TEST_F(QueueManagerTest, ReleaseNextWaitsForHead) {
    SetReleaseMinutes(Stage::kPreInspection, 20);
    Enqueue(Stage::kPreInspection, {"A"}, 0);

    auto result = manager_->ReleaseNext(Stage::kPreInspection, 5);
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result->released);
    EXPECT_TRUE(result->waiting);
    EXPECT_EQ(result->wait_minutes, 15);
    EXPECT_EQ(result->order_id, "A");

    result = manager_->ReleaseNext(Stage::kPreInspection, 20);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->released);
    EXPECT_EQ(result->order_id, "A");
    EXPECT_EQ(result->message, "Order released");
    EXPECT_TRUE(PendingIds(Stage::kPreInspection).empty());
}

TEST_F(QueueManagerTest, ReleaseNextSkipsHeldEntries) {
    Enqueue(Stage::kPreInspection, {"A", "B"}, 0);
    ASSERT_TRUE(manager_->SetHold(Stage::kPreInspection, "A", 30, "capacity", 0).ok());

    auto result = manager_->ReleaseNext(Stage::kPreInspection, 10);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->released);
    EXPECT_EQ(result->order_id, "B");

    result = manager_->ReleaseNext(Stage::kPreInspection, 10);
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result->released);
    EXPECT_EQ(result->message, "All orders on hold");

    // Expired hold is cleared and the entry released
    result = manager_->ReleaseNext(Stage::kPreInspection, 30);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->released);
    EXPECT_EQ(result->order_id, "A");
    EXPECT_FALSE(store_->Find(Stage::kPreInspection, "A")->hold_until_sim_minute.has_value());
}

//----------------------------------------------------------------------------
// CheckAndReleaseBatch
//----------------------------------------------------------------------------

TEST_F(QueueManagerTest, BatchWithoutOptimizerReleasesFifo) {
    Enqueue(Stage::kPreInspection, {"A", "B", "C"}, 0);
    EXPECT_CALL(*optimizer_, Optimize(_, _)).Times(0);

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 0, "F1");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_TRUE(result->batch_released);
    EXPECT_THAT(result->order_ids, ElementsAre("A", "B", "C"));
    EXPECT_FALSE(result->optimized);
    EXPECT_FALSE(result->optimizer_failed);
    EXPECT_EQ(result->reorder_count, 0);
    EXPECT_EQ(result->message, "Batch released");
    EXPECT_EQ(manager_->GetDispatchOrder(Stage::kPreInspection, "C"), 3);

    auto entries = log_.EntriesFor("F1", Stage::kPreInspection);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].mode(), kModeFcfs);
    EXPECT_EQ(entries[0].optimizer_run().optimizer(), "fcfs");
    EXPECT_EQ(entries[0].optimizer_run().pool_size(), 3);
    EXPECT_EQ(entries[1].mode(), kModeSummary);
    EXPECT_THAT(entries[1].release_summary().released_order_ids(), ElementsAre("A", "B", "C"));
}

TEST_F(QueueManagerTest, EmptyQueueIsNotDue) {
    auto result = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 0, "F1");
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result->batch_released);
    EXPECT_EQ(result->message, "No orders in batch");
    EXPECT_EQ(log_.size(), 0u);
}

TEST_F(QueueManagerTest, UnknownFactoryIsNotFound) {
    EXPECT_TRUE(absl::IsNotFound(manager_->CheckAndReleaseBatch(Stage::kPreInspection, 0, "F9").status()));
    EXPECT_TRUE(absl::IsNotFound(manager_->GetConfig("F9").status()));
    EXPECT_TRUE(absl::IsNotFound(manager_->MonitorStage("F9", Stage::kPreInspection, 0).status()));
}

TEST_F(QueueManagerTest, OptimizerRankingReordersRelease) {
    EnableOptimizer(Stage::kPreInspection);
    Enqueue(Stage::kPreInspection, {"A", "B", "C"}, 0);
    EXPECT_CALL(*optimizer_, Optimize(_, _))
        .WillOnce(Invoke([](const wipflow::OptimizerRequest& request, absl::Duration)
                -> absl::StatusOr<wipflow::OptimizerResponse> {
            EXPECT_EQ(request.factory_id(), "F1");
            EXPECT_EQ(request.stage(), "PIP");
            EXPECT_EQ(request.orders_size(), 3);
            return Ranked({"C", "A"});
        }));

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 0, "F1");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_TRUE(result->batch_released);
    EXPECT_THAT(result->order_ids, ElementsAre("C", "A", "B"));
    EXPECT_TRUE(result->optimized);
    EXPECT_EQ(result->reorder_count, 3);
    EXPECT_EQ(result->diff_count, 1);
    EXPECT_EQ(manager_->GetDispatchOrder(Stage::kPreInspection, "C"), 1);
    EXPECT_EQ(manager_->GetDispatchOrder(Stage::kPreInspection, "B"), 3);

    auto entries = log_.EntriesFor("F1", Stage::kPreInspection);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].mode(), kModeIntegrated);
    EXPECT_EQ(entries[0].optimizer_run().optimizer(), "mock-optimizer");
    EXPECT_EQ(entries[0].optimizer_run().request().orders_size(), 3);
    EXPECT_EQ(entries[0].optimizer_run().response().release_list_size(), 2);
    EXPECT_THAT(entries[1].release_summary().ranked_order_ids(), ElementsAre("C", "A"));
    EXPECT_TRUE(entries[1].release_summary().optimized());
}

TEST_F(QueueManagerTest, OptimizerErrorFallsBackToFifo) {
    EnableOptimizer(Stage::kPreInspection);
    Enqueue(Stage::kPreInspection, {"A", "B", "C"}, 0);
    EXPECT_CALL(*optimizer_, Optimize(_, _)).WillOnce(Return(absl::DeadlineExceededError("timed out")));

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 0, "F1");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_TRUE(result->batch_released);
    EXPECT_THAT(result->order_ids, ElementsAre("A", "B", "C"));
    EXPECT_FALSE(result->optimized);
    EXPECT_TRUE(result->optimizer_failed);

    auto entries = log_.EntriesFor("F1", Stage::kPreInspection);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_TRUE(entries[0].optimizer_run().failed());
    EXPECT_THAT(entries[0].optimizer_run().error(), ::testing::HasSubstr("timed out"));
    EXPECT_TRUE(entries[1].release_summary().optimizer_failed());
}

TEST_F(QueueManagerTest, OptimizerExceptionFallsBackToFifo) {
    EnableOptimizer(Stage::kPostInspection);
    Enqueue(Stage::kPostInspection, {"B", "A"}, 0);
    EXPECT_CALL(*optimizer_, Optimize(_, _))
        .WillOnce(Invoke([](const wipflow::OptimizerRequest&, absl::Duration)
                -> absl::StatusOr<wipflow::OptimizerResponse> {
            throw std::runtime_error("segfault in solver wrapper");
        }));

    auto result = manager_->CheckAndReleaseBatch(Stage::kPostInspection, 0, "F1");
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(result->order_ids, ElementsAre("B", "A"));
    EXPECT_TRUE(result->optimizer_failed);
}

TEST_F(QueueManagerTest, OptimizerSeesHeldEntries) {
    EnableOptimizer(Stage::kPreAcceptance);
    Enqueue(Stage::kPreAcceptance, {"A", "B", "C"}, 0);
    ASSERT_TRUE(manager_->SetHold(Stage::kPreAcceptance, "A", 60, "capacity", 0).ok());
    EXPECT_CALL(*optimizer_, Optimize(_, _))
        .WillOnce(Invoke([](const wipflow::OptimizerRequest& request, absl::Duration)
                -> absl::StatusOr<wipflow::OptimizerResponse> {
            EXPECT_EQ(request.orders_size(), 3);
            EXPECT_EQ(request.orders(0).meta().hold_until(), 60);
            return Ranked({"C", "A", "B"});
        }));

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreAcceptance, 10, "F1");
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(result->order_ids, ElementsAre("C", "B"));
    EXPECT_EQ(result->hold_count, 1);

    // PAP ranks the held entry for downstream too
    auto rows = manager_->MonitorStage("F1", Stage::kPreAcceptance, 10);
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows->size(), 1u);
    EXPECT_EQ((*rows)[0].order_id, "A");
    EXPECT_EQ((*rows)[0].queue_position, 1);
    EXPECT_EQ((*rows)[0].dispatch_position, 2);
    EXPECT_EQ((*rows)[0].delta, -1);
    EXPECT_TRUE((*rows)[0].on_hold);
}

TEST_F(QueueManagerTest, MonitorComparesQueueAndDispatchPositions) {
    AddOrders({"D", "E"});
    SetReleaseMinutes(Stage::kPreAcceptance, 30);
    EnableOptimizer(Stage::kPreAcceptance);
    Enqueue(Stage::kPreAcceptance, {"A", "B", "C", "D"}, 0);
    ASSERT_TRUE(manager_->SetHold(Stage::kPreAcceptance, "B", 60, "capacity", 0).ok());
    ASSERT_TRUE(manager_->SetHold(Stage::kPreAcceptance, "D", 45, "material", 0).ok());
    EXPECT_CALL(*optimizer_, Optimize(_, _)).WillOnce(Return(Ranked({"D", "C", "B", "A"})));

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreAcceptance, 30, "F1");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_THAT(result->order_ids, ElementsAre("C", "A"));
    Enqueue(Stage::kPreAcceptance, {"E"}, 30);

    auto rows = manager_->MonitorStage("F1", Stage::kPreAcceptance, 40);
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows->size(), 3u);

    const MonitorRow& b = (*rows)[0];
    EXPECT_EQ(b.order_id, "B");
    EXPECT_EQ(b.queue_position, 1);
    EXPECT_EQ(b.dispatch_position, 3);
    EXPECT_EQ(b.delta, -2);
    EXPECT_TRUE(b.on_hold);
    EXPECT_EQ(b.wait_minutes, 0);

    const MonitorRow& d = (*rows)[1];
    EXPECT_EQ(d.order_id, "D");
    EXPECT_EQ(d.queue_position, 2);
    EXPECT_EQ(d.dispatch_position, 1);
    EXPECT_EQ(d.delta, 1);
    EXPECT_TRUE(d.on_hold);

    // Arrived after the release, not ranked yet
    const MonitorRow& e = (*rows)[2];
    EXPECT_EQ(e.order_id, "E");
    EXPECT_EQ(e.queue_position, 3);
    EXPECT_FALSE(e.dispatch_position.has_value());
    EXPECT_FALSE(e.delta.has_value());
    EXPECT_FALSE(e.on_hold);
    EXPECT_EQ(e.wait_minutes, 20);

    // D's hold has expired by 45
    rows = manager_->MonitorStage("F1", Stage::kPreAcceptance, 45);
    ASSERT_TRUE(rows.ok());
    EXPECT_FALSE((*rows)[1].on_hold);
}

TEST_F(QueueManagerTest, OptimizerHoldDecisionsAreApplied) {
    EnableOptimizer(Stage::kPreInspection);
    Enqueue(Stage::kPreInspection, {"A", "B", "C"}, 0);
    wipflow::OptimizerResponse response;
    auto* hold = response.add_hold_decisions();
    hold->set_order_id("B");
    hold->set_hold_until_sim_minute(40.5);
    hold->set_hold_reason("tooling");
    hold = response.add_hold_decisions();
    hold->set_order_id("Z");
    hold->set_hold_until_sim_minute(40);
    hold->set_hold_reason("unknown order");
    EXPECT_CALL(*optimizer_, Optimize(_, _)).WillOnce(Return(response));

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 10, "F1");
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(result->order_ids, ElementsAre("A", "C"));
    EXPECT_EQ(result->hold_count, 1);

    auto held = store_->Find(Stage::kPreInspection, "B");
    ASSERT_TRUE(held.has_value());
    EXPECT_TRUE(held->IsPending());
    EXPECT_EQ(held->hold_until_sim_minute, 41);
    EXPECT_EQ(held->hold_reason, "tooling");
    EXPECT_EQ(held->hold_count, 1);
}

TEST_F(QueueManagerTest, AllEntriesHeldReleasesNothing) {
    Enqueue(Stage::kPreInspection, {"A", "B"}, 0);
    ASSERT_TRUE(manager_->SetHold(Stage::kPreInspection, "A", 50, "capacity", 0).ok());
    ASSERT_TRUE(manager_->SetHold(Stage::kPreInspection, "B", 60, "capacity", 0).ok());

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 10, "F1");
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result->batch_released);
    EXPECT_EQ(result->hold_count, 2);
    EXPECT_EQ(result->message, "All orders on hold");
    EXPECT_EQ(PendingIds(Stage::kPreInspection).size(), 2u);
}

TEST_F(QueueManagerTest, ConcurrentReleaseDiscardsOptimizerResult) {
    EnableOptimizer(Stage::kPreInspection);
    Enqueue(Stage::kPreInspection, {"A", "B", "C"}, 0);

    // A second cycle completes while the first one waits for its optimizer
    int calls = 0;
    EXPECT_CALL(*optimizer_, Optimize(_, _))
        .Times(2)
        .WillRepeatedly(Invoke([&](const wipflow::OptimizerRequest&, absl::Duration)
                -> absl::StatusOr<wipflow::OptimizerResponse> {
            if (calls++ == 0) {
                auto inner = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 0, "F1");
                EXPECT_TRUE(inner.ok());
                EXPECT_TRUE(inner->batch_released);
                EXPECT_THAT(inner->order_ids, ElementsAre("B", "A", "C"));
            }
            return Ranked({"B", "A", "C"});
        }));

    auto outer = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 0, "F1");
    ASSERT_TRUE(outer.ok());
    EXPECT_FALSE(outer->batch_released);
    EXPECT_FALSE(outer->optimized);
    EXPECT_EQ(outer->message, "Batch already released by a concurrent cycle");

    // Every order released exactly once
    EXPECT_TRUE(PendingIds(Stage::kPreInspection).empty());
    int summaries = 0;
    for (const auto& entry : log_.EntriesFor("F1", Stage::kPreInspection)) {
        if (entry.mode() == kModeSummary) summaries++;
    }
    EXPECT_EQ(summaries, 1);
}

TEST_F(QueueManagerTest, ClearAllDuringOptimizerCallDiscardsResult) {
    EnableOptimizer(Stage::kPreAcceptance);
    Enqueue(Stage::kPreAcceptance, {"A", "B"}, 0);
    EXPECT_CALL(*optimizer_, Optimize(_, _))
        .WillOnce(Invoke([&](const wipflow::OptimizerRequest&, absl::Duration)
                -> absl::StatusOr<wipflow::OptimizerResponse> {
            EXPECT_TRUE(manager_->ClearAll().ok());
            return Ranked({"B", "A"});
        }));

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreAcceptance, 0, "F1");
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result->batch_released);
    EXPECT_FALSE(manager_->GetDispatchOrder(Stage::kPreAcceptance, "B").has_value());
}

TEST_F(QueueManagerTest, ClearAllWaitsForCommittingCycle) {
    auto* store = new HookedCommitStore();
    store_.reset(store);
    BuildManager();
    AddOrders({"A", "B"});
    Enqueue(Stage::kPreInspection, {"A", "B"}, 0);

    std::thread clearer;
    absl::Notification clearing;
    store->before_commit = [&]() {
        clearer = std::thread([&]() {
            clearing.Notify();
            EXPECT_TRUE(manager_->ClearAll().ok());
        });
        clearing.WaitForNotification();
        absl::SleepFor(absl::Milliseconds(50));
        // Still blocked behind the stage lock
        EXPECT_EQ(store->ListPending(Stage::kPreInspection).size(), 2u);
    };

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 0, "F1");
    clearer.join();
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_TRUE(result->batch_released);
    EXPECT_THAT(result->order_ids, ElementsAre("A", "B"));
    EXPECT_FALSE(store->Find(Stage::kPreInspection, "A").has_value());
}

TEST_F(QueueManagerTest, PersistenceFailureReleasesNothing) {
    store_ = std::make_unique<FailingCommitStore>();
    BuildManager();
    AddOrders({"A", "B"});
    SetReleaseMinutes(Stage::kPreInspection, 10);
    Enqueue(Stage::kPreInspection, {"A", "B"}, 0);

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 10, "F1");
    EXPECT_TRUE(absl::IsAborted(result.status())) << result.status();
    EXPECT_EQ(PendingIds(Stage::kPreInspection).size(), 2u);
    // The window stays open for the next attempt
    EXPECT_TRUE(manager_->GetConfig("F1")->For(Stage::kPreInspection).batch_start_sim_minute.has_value());
    for (const auto& entry : log_.Entries()) {
        EXPECT_NE(entry.mode(), kModeSummary);
    }
}

TEST_F(QueueManagerTest, EtasArePersistedAfterRelease) {
    EnableOptimizer(Stage::kPreInspection);
    Enqueue(Stage::kPreInspection, {"A", "B"}, 0);
    wipflow::OptimizerResponse response = Ranked({"B", "A"});
    auto* eta = response.add_eta_list();
    eta->set_order_id("B");
    eta->set_eta(90);
    EXPECT_CALL(*optimizer_, Optimize(_, _)).WillOnce(Return(response));

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 30, "F1");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->eta_written, 1);
    EXPECT_EQ(result->eta_failed, 0);
    auto current = delivery_dates_.Current("B");
    ASSERT_TRUE(current.has_value());
    EXPECT_DOUBLE_EQ(current->eta_sim_minute, 120);
    EXPECT_EQ(current->optimizer, "mock-optimizer");
}

TEST_F(QueueManagerTest, SchedulingLogFailureDoesNotFailCycle) {
    ::testing::NiceMock<MockSchedulingLog> failing_log;
    ON_CALL(failing_log, Append(_)).WillByDefault(Return(absl::UnavailableError("log offline")));
    scheduling_log_ = &failing_log;
    BuildManager();
    AddOrders({"A"});
    EXPECT_CALL(failing_log, Append(_)).Times(2);
    Enqueue(Stage::kPreInspection, {"A"}, 0);

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 0, "F1");
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->batch_released);
    manager_.reset();
}

TEST_F(QueueManagerTest, FactoriesReleaseIndependently) {
    ASSERT_TRUE(manager_->RegisterFactory("F2").ok());
    AddOrders({"X"}, "F2");
    Enqueue(Stage::kPreInspection, {"A", "X", "B"}, 0);

    auto result = manager_->CheckAndReleaseBatch(Stage::kPreInspection, 0, "F1");
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(result->order_ids, ElementsAre("A", "B"));
    EXPECT_THAT(PendingIds(Stage::kPreInspection), ElementsAre("X"));
}

//----------------------------------------------------------------------------
// Holds, configuration and administration
//----------------------------------------------------------------------------

TEST_F(QueueManagerTest, HoldOperationsRequirePendingEntry) {
    Enqueue(Stage::kPreInspection, {"A"}, 0);
    EXPECT_TRUE(absl::IsNotFound(manager_->SetHold(Stage::kPreInspection, "B", 10, "capacity", 0).status()));
    EXPECT_TRUE(absl::IsNotFound(manager_->ClearHold(Stage::kPreInspection, "B").status()));
    EXPECT_TRUE(absl::IsInvalidArgument(manager_->SetHold(Stage::kPreInspection, "A", 10, "", 0).status()));

    auto held = manager_->SetHold(Stage::kPreInspection, "A", 10, "capacity", 0);
    ASSERT_TRUE(held.ok());
    auto cleared = manager_->ClearHold(Stage::kPreInspection, "A");
    ASSERT_TRUE(cleared.ok());
    EXPECT_FALSE(cleared->hold_until_sim_minute.has_value());
    EXPECT_EQ(cleared->hold_count, 1);
}

TEST_F(QueueManagerTest, SetMultipleHoldsReportsPerItem) {
    Enqueue(Stage::kPreInspection, {"A", "B"}, 0);
    auto result = manager_->SetMultipleHolds(Stage::kPreInspection,
            {{"A", 20, "capacity"}, {"C", 20, "capacity"}, {"B", 30, "material"}}, 0);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->successful, 2u);
    ASSERT_EQ(result->items.size(), 3u);
    EXPECT_TRUE(absl::IsNotFound(result->items[1].status));
}

TEST_F(QueueManagerTest, ConfigUpdatesValidateAndApply) {
    auto defaults = manager_->GetConfig("F1");
    ASSERT_TRUE(defaults.ok());
    EXPECT_EQ(defaults->For(Stage::kPreAcceptance).release_after_minutes, 0);

    QueueConfigUpdate bad;
    bad.Set(Stage::kPreAcceptance, StageConfigUpdate{-5, std::nullopt});
    EXPECT_TRUE(absl::IsInvalidArgument(manager_->UpdateConfig("F1", bad).status()));

    SetReleaseMinutes(Stage::kPostInspection, 45);
    EXPECT_EQ(manager_->GetConfig("F1")->For(Stage::kPostInspection).release_after_minutes, 45);
}

TEST_F(QueueManagerTest, ClearAllEmptiesQueuesAndWindows) {
    SetReleaseMinutes(Stage::kPreInspection, 30);
    Enqueue(Stage::kPreInspection, {"A", "B"}, 0);
    Enqueue(Stage::kPreAcceptance, {"C"}, 0);
    ASSERT_TRUE(manager_->ClearAll().ok());

    EXPECT_TRUE(PendingIds(Stage::kPreInspection).empty());
    EXPECT_TRUE(PendingIds(Stage::kPreAcceptance).empty());
    EXPECT_FALSE(manager_->GetConfig("F1")->For(Stage::kPreInspection).batch_start_sim_minute.has_value());
}

TEST_F(QueueManagerTest, RemoveAndClearReleasedEntries) {
    Enqueue(Stage::kPreInspection, {"A", "B", "C"}, 0);
    ASSERT_TRUE(manager_->RemoveEntry(Stage::kPreInspection, "B").ok());
    EXPECT_TRUE(absl::IsNotFound(manager_->RemoveEntry(Stage::kPreInspection, "B")));

    ASSERT_TRUE(manager_->ReleaseNext(Stage::kPreInspection, 0).ok());
    auto removed = manager_->ClearReleasedEntries(Stage::kPreInspection);
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(*removed, 1u);
    EXPECT_THAT(PendingIds(Stage::kPreInspection), ElementsAre("C"));
}

TEST_F(QueueManagerTest, StatusReportsHolds) {
    SetReleaseMinutes(Stage::kPreInspection, 30);
    Enqueue(Stage::kPreInspection, {"A"}, 0);
    ASSERT_TRUE(manager_->SetHold(Stage::kPreInspection, "A", 100, "capacity", 0).ok());

    auto status = manager_->Status(Stage::kPreInspection, 40);
    ASSERT_TRUE(status.ok());
    ASSERT_EQ(status->total_count, 1u);
    EXPECT_TRUE(status->entries[0].is_ready);
    EXPECT_TRUE(status->entries[0].on_hold);
}
