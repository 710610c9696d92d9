#ifndef WIPFLOW_SCHEDULER_QUEUE_MANAGER_H_
#define WIPFLOW_SCHEDULER_QUEUE_MANAGER_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include <optimizer.pb.h>

#include "common/fine_grained_lock.h"
#include "common/sim_clock.h"
#include "queue/hold_registry.h"
#include "queue/order_directory.h"
#include "queue/queue_store.h"
#include "queue/stage_config_repository.h"
#include "scheduler/batch_window.h"
#include "scheduler/delivery_date_store.h"
#include "scheduler/optimizer_bridge.h"
#include "scheduler/release_reconciler.h"
#include "scheduler/scheduling_log.h"

namespace Wipflow {

struct EnqueueResult {
	bool skipped = false;
	bool window_opened = false;
	QueueEntry entry;
};

struct ReleaseNextResult {
	bool released = false;
	bool waiting = false;
	SimMinute wait_minutes = 0;
	std::string message;
	std::string order_id;
	std::string possible_sequence;
	std::string process_times;
};

struct BatchReleaseResult {
	bool batch_released = false;
	bool waiting = false;
	SimMinute wait_minutes = 0;
	std::string message;
	std::vector<std::string> order_ids;   // release order
	int hold_count = 0;
	int cleared_hold_count = 0;
	bool optimized = false;
	bool optimizer_failed = false;
	int eta_written = 0;
	int eta_failed = 0;
	int reorder_count = 0;
	int diff_count = 0;
};

// One row of the queue monitor: FIFO position against the persisted dispatch rank
struct MonitorRow {
	std::string order_id;
	int64_t queue_position = 0;
	std::optional<int64_t> dispatch_position;
	std::optional<int64_t> delta;   // queue_position - dispatch_position
	bool on_hold = false;
	SimMinute wait_minutes = 0;
};

/**
 * Public entry point of the three-stage pipeline.
 *
 * A release cycle for one (factory, stage) runs in two locked phases around
 * the optimizer call:
 *   1. check the window, snapshot the pending pool, remember the generation
 *   2. (unlocked) ask the optimizer
 *   3. drop the result if another cycle released meanwhile; otherwise apply
 *      hold decisions, partition by hold, reconcile and commit atomically
 * ETAs and the summary record are written after the lock is released.
 *
 * Every operation reports errors through absl::Status and never throws.
 */
class QueueManager {
public:
	struct Dependencies {
		IQueueStore* store = nullptr;
		IStageConfigRepository* configs = nullptr;
		OrderDirectory* orders = nullptr;
		IDeliveryDateStore* delivery_dates = nullptr;   // optional
		ISchedulingLog* scheduling_log = nullptr;       // optional
		OptimizerBridge* optimizer_bridge = nullptr;    // optional, FIFO only without it
		const SimClock* clock = nullptr;                // optional, calendar mapping of ETAs
		wipflow::StagePolicy batch_policy;
	};

	explicit QueueManager(const Dependencies& deps);

	// Registration
	absl::Status RegisterFactory(const std::string& factory_id);
	absl::Status RegisterOrder(const OrderInfo& order);

	// Queue operations
	absl::StatusOr<EnqueueResult> Enqueue(Stage stage, const std::string& order_id, SimMinute sim_minute,
			const std::optional<std::string>& possible_sequence = std::nullopt,
			const std::optional<std::string>& process_times = std::nullopt);
	absl::StatusOr<ReleaseNextResult> ReleaseNext(Stage stage, SimMinute sim_minute);
	absl::StatusOr<BatchReleaseResult> CheckAndReleaseBatch(Stage stage, SimMinute sim_minute,
			const std::string& factory_id);
	absl::StatusOr<QueueStatus> Status(Stage stage, SimMinute sim_minute = 0) const;

	// Holds
	absl::StatusOr<QueueEntry> SetHold(Stage stage, const std::string& order_id,
			SimMinute hold_until_sim_minute, const std::string& reason, SimMinute sim_minute);
	absl::StatusOr<QueueEntry> ClearHold(Stage stage, const std::string& order_id);
	absl::StatusOr<MultiHoldResult> SetMultipleHolds(Stage stage, const std::vector<HoldRequest>& holds,
			SimMinute sim_minute);

	// Configuration
	absl::StatusOr<FactoryQueueConfig> GetConfig(const std::string& factory_id);
	absl::StatusOr<FactoryQueueConfig> UpdateConfig(const std::string& factory_id,
			const QueueConfigUpdate& update);

	// Administration
	absl::Status ClearAll();
	absl::StatusOr<size_t> ClearReleasedEntries(Stage stage);
	absl::Status RemoveEntry(Stage stage, const std::string& order_id);

	absl::StatusOr<std::vector<MonitorRow>> MonitorStage(const std::string& factory_id, Stage stage,
			SimMinute sim_minute) const;

	std::optional<int64_t> GetDispatchOrder(Stage stage, const std::string& order_id) const {
		return store_->GetDispatchOrder(stage, order_id);
	}

private:
	void LogOptimizerRun(const std::string& factory_id, Stage stage, SimMinute now,
			const std::vector<QueueEntry>& pool, const wipflow::OptimizerRequest* request,
			const OptimizerInvocation& invocation);
	void LogReleaseSummary(const std::string& factory_id, Stage stage, SimMinute now,
			const ReleasePlan& plan, const BatchReleaseResult& result);
	int ApplyHoldDecisions(Stage stage, const std::vector<QueueEntry>& pool,
			const wipflow::OptimizerResponse& response, SimMinute now);

	IQueueStore* store_;
	IStageConfigRepository* configs_;
	OrderDirectory* orders_;
	IDeliveryDateStore* delivery_dates_;
	ISchedulingLog* scheduling_log_;
	OptimizerBridge* optimizer_bridge_;
	const SimClock* clock_;
	wipflow::StagePolicy batch_policy_;

	HoldRegistry holds_;
	BatchWindowController windows_;
	ReleaseReconciler reconciler_;
	StageLock stage_locks_;
};

} // namespace Wipflow

#endif // WIPFLOW_SCHEDULER_QUEUE_MANAGER_H_
