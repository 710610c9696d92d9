#include "scheduler/queue_manager.h"

#include <algorithm>
#include <cmath>

#include <glog/logging.h>

#include "absl/container/flat_hash_set.h"
#include "common/config.h"

namespace Wipflow {

QueueManager::QueueManager(const Dependencies& deps)
	: store_(deps.store),
	  configs_(deps.configs),
	  orders_(deps.orders),
	  delivery_dates_(deps.delivery_dates),
	  scheduling_log_(deps.scheduling_log),
	  optimizer_bridge_(deps.optimizer_bridge),
	  clock_(deps.clock),
	  batch_policy_(deps.batch_policy),
	  holds_(deps.store),
	  windows_(deps.configs),
	  reconciler_(deps.store, deps.delivery_dates, deps.clock) {
	CHECK(orders_ != nullptr) << "QueueManager needs an order directory";
}

absl::Status QueueManager::RegisterFactory(const std::string& factory_id) {
	return configs_->RegisterFactory(factory_id);
}

absl::Status QueueManager::RegisterOrder(const OrderInfo& order) {
	if (!configs_->HasFactory(order.factory_id)) {
		return absl::NotFoundError("factory " + order.factory_id + " not found for order " + order.order_id);
	}
	return orders_->Register(order);
}

//----------------------------------------------------------------------------
// Queue operations
//----------------------------------------------------------------------------

absl::StatusOr<EnqueueResult> QueueManager::Enqueue(Stage stage, const std::string& order_id,
		SimMinute sim_minute, const std::optional<std::string>& possible_sequence,
		const std::optional<std::string>& process_times) {
	std::optional<OrderInfo> order = orders_->Find(order_id);
	if (!order) {
		return absl::NotFoundError("order " + order_id + " not found");
	}
	absl::StatusOr<FactoryQueueConfig> config = configs_->Get(order->factory_id);
	if (!config.ok()) return config.status();

	NewEntry entry;
	entry.order_id = order_id;
	entry.factory_id = order->factory_id;
	entry.possible_sequence = possible_sequence.value_or(order->possible_sequence);
	entry.process_times = process_times.value_or(order->process_times);
	entry.release_after_minutes = config->For(stage).release_after_minutes;

	// Serialized with release cycles so a window opened here is never closed by a cycle that missed the entry
	StageLock::Guard guard(stage_locks_, order->factory_id, stage);
	EnqueueOutcome outcome = store_->Enqueue(stage, entry, sim_minute);

	EnqueueResult result;
	result.skipped = outcome.skipped;
	result.entry = std::move(outcome.entry);
	if (result.skipped) {
		return result;
	}

	absl::StatusOr<bool> opened = windows_.OnEnqueue(order->factory_id, stage, sim_minute);
	if (!opened.ok()) {
		LOG(WARNING) << "[QueueManager] could not open batch window for " << StageLock::Key(order->factory_id, stage)
			<< ": " << opened.status();
	} else {
		result.window_opened = *opened;
	}
	VLOG(2) << "\t[QueueManager] " << StageCode(stage) << " enqueued " << order_id << " at " << sim_minute
		<< " (order " << result.entry.processing_order << ")";
	return result;
}

absl::StatusOr<ReleaseNextResult> QueueManager::ReleaseNext(Stage stage, SimMinute sim_minute) {
	ReleaseNextResult result;
	std::vector<QueueEntry> pending = store_->ListPending(stage);

	for (const QueueEntry& candidate : pending) {
		StageLock::Guard guard(stage_locks_, candidate.factory_id, stage);
		std::optional<QueueEntry> entry = store_->Find(stage, candidate.order_id);
		if (!entry || !entry->IsPending() || entry->id != candidate.id) {
			continue;
		}
		if (entry->HasActiveHold(sim_minute)) {
			continue;
		}
		if (entry->HasExpiredHold(sim_minute)) {
			absl::StatusOr<QueueEntry> cleared = holds_.ClearHold(stage, entry->order_id);
			if (!cleared.ok()) return cleared.status();
		}

		if (sim_minute < entry->ReleaseAtSimMinute()) {
			result.waiting = true;
			result.wait_minutes = entry->ReleaseAtSimMinute() - sim_minute;
			result.message = "Next order not due yet";
			result.order_id = entry->order_id;
			return result;
		}

		std::vector<std::string> marked = store_->MarkReleased(stage, {entry->order_id}, sim_minute);
		if (marked.empty()) {
			continue;
		}
		result.released = true;
		result.order_id = entry->order_id;
		result.possible_sequence = entry->possible_sequence;
		result.process_times = entry->process_times;
		result.message = "Order released";
		VLOG(1) << "\t[QueueManager] " << StageCode(stage) << " released " << entry->order_id << " at " << sim_minute;
		return result;
	}

	result.message = pending.empty() ? "Queue is empty" : "All orders on hold";
	return result;
}

absl::StatusOr<BatchReleaseResult> QueueManager::CheckAndReleaseBatch(Stage stage, SimMinute sim_minute,
		const std::string& factory_id) {
	BatchReleaseResult result;
	std::vector<QueueEntry> pool;
	StageConfig stage_config;
	uint64_t generation = 0;

	// Phase 1: due check and snapshot
	{
		StageLock::Guard guard(stage_locks_, factory_id, stage);
		absl::StatusOr<FactoryQueueConfig> config = configs_->Get(factory_id);
		if (!config.ok()) return config.status();
		stage_config = config->For(stage);

		pool = store_->ListPending(stage, factory_id);
		absl::StatusOr<WindowCheck> check = windows_.CheckDue(factory_id, stage, sim_minute, !pool.empty());
		if (!check.ok()) return check.status();
		if (!check->due) {
			result.waiting = check->waiting;
			result.wait_minutes = check->wait_minutes;
			result.message = check->message;
			return result;
		}

		size_t active_holds = 0;
		for (const QueueEntry& entry : pool) {
			if (entry.HasActiveHold(sim_minute)) active_holds++;
		}
		if (active_holds == pool.size()) {
			result.hold_count = static_cast<int>(active_holds);
			result.message = "All orders on hold";
			return result;
		}
		generation = windows_.Generation(factory_id, stage);
	}

	// Phase 2: optimizer, unlocked
	OptimizerInvocation invocation;
	std::optional<wipflow::OptimizerRequest> request;
	if (optimizer_bridge_ != nullptr && stage_config.optimizer.enabled()) {
		request = BuildOptimizerRequest(factory_id, stage, sim_minute, pool, *orders_, stage_config, batch_policy_);
		invocation = optimizer_bridge_->Invoke(stage_config.optimizer, *request, sim_minute);
	}
	LogOptimizerRun(factory_id, stage, sim_minute, pool, request ? &*request : nullptr, invocation);
	const wipflow::OptimizerResponse* response = invocation.response ? &*invocation.response : nullptr;
	result.optimized = response != nullptr;
	result.optimizer_failed = invocation.failed;

	// Phase 3: reconcile and commit
	ReleasePlan plan;
	{
		StageLock::Guard guard(stage_locks_, factory_id, stage);
		if (windows_.Generation(factory_id, stage) != generation) {
			VLOG(1) << "\t[QueueManager] " << StageLock::Key(factory_id, stage)
				<< " released by a concurrent cycle, optimizer result discarded";
			result.optimized = false;
			result.message = "Batch already released by a concurrent cycle";
			return result;
		}

		if (response != nullptr && response->hold_decisions_size() > 0) {
			ApplyHoldDecisions(stage, pool, *response, sim_minute);
		}

		pool = store_->ListPending(stage, factory_id);
		if (pool.empty()) {
			absl::StatusOr<WindowCheck> closed = windows_.CheckDue(factory_id, stage, sim_minute, false);
			if (!closed.ok()) return closed.status();
			result.message = closed->message;
			return result;
		}

		HoldPartition partition = holds_.PartitionEligible(stage, pool, sim_minute);
		result.hold_count = static_cast<int>(partition.on_hold.size());
		result.cleared_hold_count = static_cast<int>(partition.cleared);
		if (partition.eligible.empty()) {
			result.message = "All orders on hold";
			return result;
		}

		plan = reconciler_.Plan(stage, pool, partition.eligible, response);
		absl::Status committed = reconciler_.Commit(stage, plan, sim_minute);
		if (!committed.ok()) {
			LOG(ERROR) << "[QueueManager] release commit for " << StageLock::Key(factory_id, stage)
				<< " failed, nothing released: " << committed;
			return absl::AbortedError("release commit failed: " + std::string(committed.message()));
		}

		absl::Status closed = windows_.MarkReleased(factory_id, stage);
		if (!closed.ok()) {
			LOG(WARNING) << "[QueueManager] closing window for " << StageLock::Key(factory_id, stage)
				<< " failed: " << closed;
		} else if (!partition.on_hold.empty()) {
			absl::StatusOr<bool> reopened = windows_.CarryOver(factory_id, stage, sim_minute);
			if (!reopened.ok()) {
				LOG(WARNING) << "[QueueManager] reopening window for " << partition.on_hold.size()
					<< " held entries of " << StageLock::Key(factory_id, stage) << " failed: " << reopened.status();
			}
		}
	}

	result.batch_released = true;
	result.order_ids = plan.release_ids;
	result.reorder_count = plan.reorder_count;
	result.diff_count = plan.diff_count;
	result.message = "Batch released";

	// Best effort, after the release is durable
	if (response != nullptr) {
		EtaPropagation etas = reconciler_.PropagateEtas(stage, pool, *response, invocation.optimizer, sim_minute);
		result.eta_written = etas.written;
		result.eta_failed = etas.failed;
	}
	LogReleaseSummary(factory_id, stage, sim_minute, plan, result);

	VLOG(1) << "\t[QueueManager] " << StageLock::Key(factory_id, stage) << " released "
		<< result.order_ids.size() << " at " << sim_minute << " (held " << result.hold_count
		<< ", cleared " << result.cleared_hold_count << ", reordered " << result.reorder_count
		<< (result.optimizer_failed ? ", optimizer failed" : "") << ")";
	return result;
}

absl::StatusOr<QueueStatus> QueueManager::Status(Stage stage, SimMinute sim_minute) const {
	return store_->Status(stage, sim_minute);
}

int QueueManager::ApplyHoldDecisions(Stage stage, const std::vector<QueueEntry>& pool,
		const wipflow::OptimizerResponse& response, SimMinute now) {
	absl::flat_hash_set<std::string> pool_ids;
	for (const QueueEntry& entry : pool) pool_ids.insert(entry.order_id);

	std::vector<HoldRequest> holds;
	for (const wipflow::HoldDecision& decision : response.hold_decisions()) {
		if (!pool_ids.contains(decision.order_id())) {
			VLOG(2) << "\t[QueueManager] hold decision for unknown order " << decision.order_id() << " ignored";
			continue;
		}
		holds.push_back(HoldRequest{decision.order_id(),
				static_cast<SimMinute>(std::ceil(decision.hold_until_sim_minute())), decision.hold_reason()});
	}
	if (holds.empty()) return 0;
	MultiHoldResult applied = holds_.SetMultiple(stage, holds, now);
	VLOG(1) << "\t[QueueManager] " << StageCode(stage) << " applied " << applied.successful << "/"
		<< holds.size() << " optimizer hold decisions";
	return static_cast<int>(applied.successful);
}

//----------------------------------------------------------------------------
// Holds
//----------------------------------------------------------------------------

absl::StatusOr<QueueEntry> QueueManager::SetHold(Stage stage, const std::string& order_id,
		SimMinute hold_until_sim_minute, const std::string& reason, SimMinute sim_minute) {
	std::optional<QueueEntry> entry = store_->Find(stage, order_id);
	if (!entry || !entry->IsPending()) {
		return absl::NotFoundError("no pending entry for order " + order_id + " in " + StageName(stage));
	}
	StageLock::Guard guard(stage_locks_, entry->factory_id, stage);
	return holds_.SetHold(stage, order_id, hold_until_sim_minute, reason, sim_minute);
}

absl::StatusOr<QueueEntry> QueueManager::ClearHold(Stage stage, const std::string& order_id) {
	std::optional<QueueEntry> entry = store_->Find(stage, order_id);
	if (!entry || !entry->IsPending()) {
		return absl::NotFoundError("no pending entry for order " + order_id + " in " + StageName(stage));
	}
	StageLock::Guard guard(stage_locks_, entry->factory_id, stage);
	return holds_.ClearHold(stage, order_id);
}

absl::StatusOr<MultiHoldResult> QueueManager::SetMultipleHolds(Stage stage, const std::vector<HoldRequest>& holds,
		SimMinute sim_minute) {
	MultiHoldResult result;
	for (const HoldRequest& hold : holds) {
		absl::StatusOr<QueueEntry> applied = SetHold(stage, hold.order_id, hold.hold_until_sim_minute,
				hold.hold_reason, sim_minute);
		if (applied.ok()) {
			result.successful++;
		} else {
			LOG(WARNING) << "[QueueManager] hold on " << hold.order_id << " failed: " << applied.status();
		}
		result.items.push_back(HoldItemResult{hold.order_id, applied.status()});
	}
	return result;
}

//----------------------------------------------------------------------------
// Configuration and administration
//----------------------------------------------------------------------------

absl::StatusOr<FactoryQueueConfig> QueueManager::GetConfig(const std::string& factory_id) {
	return configs_->Get(factory_id);
}

absl::StatusOr<FactoryQueueConfig> QueueManager::UpdateConfig(const std::string& factory_id,
		const QueueConfigUpdate& update) {
	absl::StatusOr<FactoryQueueConfig> updated = configs_->Update(factory_id, update);
	if (updated.ok()) {
		VLOG(1) << "\t[QueueManager] config of " << factory_id << " updated: PAP="
			<< updated->For(Stage::kPreAcceptance).release_after_minutes << " PIP="
			<< updated->For(Stage::kPreInspection).release_after_minutes << " PIPO="
			<< updated->For(Stage::kPostInspection).release_after_minutes;
	}
	return updated;
}

absl::Status QueueManager::ClearAll() {
	// Waits out every locked phase; cycles in their optimizer call see the generation change
	StageLock::AllGuard guard(stage_locks_);
	store_->Clear();
	windows_.Reset();
	LOG(INFO) << "[QueueManager] all queues and batch windows cleared";
	return absl::OkStatus();
}

absl::StatusOr<size_t> QueueManager::ClearReleasedEntries(Stage stage) {
	size_t removed = store_->ClearReleased(stage);
	VLOG(1) << "\t[QueueManager] " << StageCode(stage) << " removed " << removed << " released entries";
	return removed;
}

absl::Status QueueManager::RemoveEntry(Stage stage, const std::string& order_id) {
	std::optional<QueueEntry> entry = store_->Find(stage, order_id);
	if (!entry || !entry->IsPending()) {
		return absl::NotFoundError("no pending entry for order " + order_id + " in " + StageName(stage));
	}
	StageLock::Guard guard(stage_locks_, entry->factory_id, stage);
	if (!store_->Remove(stage, order_id)) {
		return absl::NotFoundError("order " + order_id + " was released or removed concurrently");
	}
	return absl::OkStatus();
}

absl::StatusOr<std::vector<MonitorRow>> QueueManager::MonitorStage(const std::string& factory_id, Stage stage,
		SimMinute sim_minute) const {
	if (!configs_->HasFactory(factory_id)) {
		return absl::NotFoundError("factory " + factory_id + " not found");
	}
	std::vector<MonitorRow> rows;
	int64_t position = 1;
	for (const QueueEntry& entry : store_->ListPending(stage, factory_id)) {
		MonitorRow row;
		row.order_id = entry.order_id;
		row.queue_position = position++;
		row.dispatch_position = store_->GetDispatchOrder(stage, entry.order_id);
		if (row.dispatch_position) row.delta = row.queue_position - *row.dispatch_position;
		row.on_hold = entry.HasActiveHold(sim_minute);
		row.wait_minutes = std::max<SimMinute>(0, entry.ReleaseAtSimMinute() - sim_minute);
		rows.push_back(std::move(row));
	}
	return rows;
}

//----------------------------------------------------------------------------
// Scheduling log records
//----------------------------------------------------------------------------

void QueueManager::LogOptimizerRun(const std::string& factory_id, Stage stage, SimMinute now,
		const std::vector<QueueEntry>& pool, const wipflow::OptimizerRequest* request,
		const OptimizerInvocation& invocation) {
	if (scheduling_log_ == nullptr) return;
	wipflow::SchedulingLogEntry entry = NewLogEntry(factory_id, stage,
			invocation.invoked ? kModeIntegrated : kModeFcfs, now);
	wipflow::OptimizerRunDetails* run = entry.mutable_optimizer_run();
	run->set_optimizer(invocation.invoked ? invocation.optimizer : "fcfs");
	run->set_pool_size(static_cast<int32_t>(pool.size()));
	run->set_failed(invocation.failed);
	run->set_error(invocation.error);
	run->set_duration_ms(invocation.duration_ms);
	run->set_dropped_items(invocation.validation.total());
	if (request != nullptr) *run->mutable_request() = *request;
	if (invocation.response) {
		*run->mutable_response() = *invocation.response;
		if (stage == Stage::kPreAcceptance) {
			for (auto& insight : BuildBatchInsights(*invocation.response, pool, kMaxBatchInsights)) {
				*run->add_batch_insights() = std::move(insight);
			}
		}
	}
	LogBestEffort(scheduling_log_, entry);
}

void QueueManager::LogReleaseSummary(const std::string& factory_id, Stage stage, SimMinute now,
		const ReleasePlan& plan, const BatchReleaseResult& result) {
	if (scheduling_log_ == nullptr) return;
	wipflow::SchedulingLogEntry entry = NewLogEntry(factory_id, stage, kModeSummary, now);
	wipflow::ReleaseSummaryDetails* summary = entry.mutable_release_summary();
	for (const std::string& id : plan.release_ids) summary->add_released_order_ids(id);
	for (const std::string& id : plan.ranking) summary->add_ranked_order_ids(id);
	summary->set_hold_count(result.hold_count);
	summary->set_cleared_hold_count(result.cleared_hold_count);
	summary->set_reorder_count(result.reorder_count);
	summary->set_diff_count(result.diff_count);
	summary->set_eta_written(result.eta_written);
	summary->set_eta_failed(result.eta_failed);
	summary->set_optimized(result.optimized);
	summary->set_optimizer_failed(result.optimizer_failed);
	LogBestEffort(scheduling_log_, entry);
}

} // namespace Wipflow
