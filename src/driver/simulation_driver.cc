#include "driver/simulation_driver.h"

#include <glog/logging.h>

namespace Wipflow {

namespace {

int StageReleaseMinutes(const WipflowConfig& config, Stage stage) {
	switch (stage) {
		case Stage::kPreAcceptance: return config.scheduler.pap_release_minutes.get();
		case Stage::kPreInspection: return config.scheduler.pip_release_minutes.get();
		case Stage::kPostInspection: return config.scheduler.pipo_release_minutes.get();
	}
	return 0;
}

std::string StageCommand(const WipflowConfig& config, Stage stage) {
	switch (stage) {
		case Stage::kPreAcceptance: return config.optimizer.pap_command.get();
		case Stage::kPreInspection: return config.optimizer.pip_command.get();
		case Stage::kPostInspection: return config.optimizer.pipo_command.get();
	}
	return "";
}

} // namespace

std::array<StageConfig, kNumStages> StageDefaultsFromConfig(const WipflowConfig& config) {
	std::array<StageConfig, kNumStages> defaults;
	std::optional<OptimizerKind> kind = ParseOptimizerKind(config.optimizer.kind.get());
	for (Stage stage : kAllStages) {
		StageConfig& target = defaults[StageIndex(stage)];
		target.release_after_minutes = StageReleaseMinutes(config, stage);
		target.optimizer.kind = kind.value_or(OptimizerKind::kNone);
		target.optimizer.command = StageCommand(config, stage);
		target.optimizer.endpoint = config.optimizer.endpoint.get();
		// A process optimizer without a command for this stage runs FIFO
		if (target.optimizer.kind == OptimizerKind::kProcess && target.optimizer.command.empty()) {
			target.optimizer.kind = OptimizerKind::kNone;
		}
	}
	return defaults;
}

wipflow::StagePolicy BatchPolicyFromConfig(const WipflowConfig& config) {
	wipflow::StagePolicy policy;
	policy.set_q_min(config.batch_policy.q_min.get());
	policy.set_q_max(config.batch_policy.q_max.get());
	policy.set_horizon_minutes(config.batch_policy.horizon_minutes.get());
	policy.set_interval_minutes(config.batch_policy.interval_minutes.get());
	policy.set_poisson_lambda(config.batch_policy.poisson_lambda.get());
	return policy;
}

absl::StatusOr<QueueConfigUpdate> FactoryOverrides(const FactoryEntry& factory) {
	QueueConfigUpdate update;
	for (Stage stage : kAllStages) {
		const size_t i = StageIndex(stage);
		if (!factory.release_minutes[i] && !factory.optimizer[i]) continue;
		StageConfigUpdate stage_update;
		stage_update.release_after_minutes = factory.release_minutes[i];
		if (factory.optimizer[i]) {
			const OptimizerEntry& entry = *factory.optimizer[i];
			std::optional<OptimizerKind> kind = ParseOptimizerKind(entry.kind);
			if (!kind) {
				return absl::InvalidArgumentError("factory " + factory.id + ": unknown optimizer kind " + entry.kind);
			}
			OptimizerSettings settings;
			settings.kind = *kind;
			settings.command = entry.command;
			settings.endpoint = entry.endpoint;
			settings.timeout_ms = entry.timeout_ms;
			settings.label = entry.label;
			stage_update.optimizer = settings;
		}
		update.Set(stage, stage_update);
	}
	return update;
}

SimulationDriver::SimulationDriver(QueueManager* manager, SimClock* clock)
	: manager_(manager), clock_(clock) {}

absl::Status SimulationDriver::Load(const Workload& workload) {
	for (const std::string& factory : workload.factories) {
		absl::Status status = manager_->RegisterFactory(factory);
		if (!status.ok()) return status;
	}
	for (const WorkloadOrder& order : workload.orders) {
		absl::Status status = manager_->RegisterOrder(order.info);
		if (!status.ok()) return status;
	}
	workload_ = workload;
	next_arrival_ = 0;
	next_hold_ = 0;
	completed_ = 0;
	LOG(INFO) << "Workload loaded: " << workload_.factories.size() << " factories, "
		<< workload_.orders.size() << " orders, " << workload_.holds.size() << " scripted holds";
	return absl::OkStatus();
}

void SimulationDriver::Advance(Stage stage, const std::string& order_id, SimMinute now, TickReport* report) {
	std::optional<Stage> next = NextStage(stage);
	if (!next) {
		completed_++;
		return;
	}
	absl::StatusOr<EnqueueResult> enqueued = manager_->Enqueue(*next, order_id, now);
	if (!enqueued.ok()) {
		LOG(ERROR) << "Enqueue of " << order_id << " into " << StageCode(*next) << " failed: " << enqueued.status();
		report->failures++;
	}
}

TickReport SimulationDriver::Tick() {
	TickReport report;
	report.now = clock_->Now();

	while (next_arrival_ < workload_.orders.size() && workload_.orders[next_arrival_].arrival <= report.now) {
		const WorkloadOrder& order = workload_.orders[next_arrival_++];
		absl::StatusOr<EnqueueResult> enqueued = manager_->Enqueue(Stage::kPreAcceptance, order.info.order_id, report.now);
		if (!enqueued.ok()) {
			LOG(ERROR) << "Arrival of " << order.info.order_id << " failed: " << enqueued.status();
			report.failures++;
			continue;
		}
		report.arrivals++;
	}

	while (next_hold_ < workload_.holds.size() && workload_.holds[next_hold_].at <= report.now) {
		const ScriptedHold& hold = workload_.holds[next_hold_++];
		absl::StatusOr<QueueEntry> held = manager_->SetHold(hold.stage, hold.order_id, hold.until, hold.reason, report.now);
		if (!held.ok()) {
			LOG(WARNING) << "Scripted hold on " << hold.order_id << " not applied: " << held.status();
		}
	}

	for (Stage stage : kAllStages) {
		for (const std::string& factory : workload_.factories) {
			absl::StatusOr<BatchReleaseResult> cycle = manager_->CheckAndReleaseBatch(stage, report.now, factory);
			if (!cycle.ok()) {
				LOG(ERROR) << "Release cycle " << factory << "/" << StageCode(stage) << " failed: " << cycle.status();
				report.failures++;
				continue;
			}
			if (!cycle->batch_released) continue;
			report.released[StageIndex(stage)] += cycle->order_ids.size();
			for (const std::string& order_id : cycle->order_ids) {
				Advance(stage, order_id, report.now, &report);
			}
		}
		absl::StatusOr<QueueStatus> status = manager_->Status(stage, report.now);
		if (status.ok()) report.pending[StageIndex(stage)] = status->total_count;
	}
	report.completed = completed_;
	return report;
}

void SimulationDriver::RunUntil(SimMinute until, SimMinute step,
		const std::function<void(const TickReport&)>& on_tick) {
	CHECK_GT(step, 0) << "Simulation step must be positive";
	while (clock_->Now() <= until) {
		TickReport report = Tick();
		if (on_tick) on_tick(report);
		clock_->Advance(step);
	}
}

} // namespace Wipflow
