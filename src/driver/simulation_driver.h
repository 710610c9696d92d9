#pragma once

#include <array>
#include <functional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "common/configuration.h"
#include "common/sim_clock.h"
#include "driver/workload.h"
#include "scheduler/queue_manager.h"

namespace Wipflow {

// Stage defaults (release minutes, optimizer) from the loaded configuration
std::array<StageConfig, kNumStages> StageDefaultsFromConfig(const WipflowConfig& config);
wipflow::StagePolicy BatchPolicyFromConfig(const WipflowConfig& config);
absl::StatusOr<QueueConfigUpdate> FactoryOverrides(const FactoryEntry& factory);

struct TickReport {
	SimMinute now = 0;
	std::array<size_t, kNumStages> released{};
	std::array<size_t, kNumStages> pending{};
	size_t arrivals = 0;
	size_t completed = 0;   // cumulative, released from PIPO
	int failures = 0;
};

/**
 * Caller that advances the simulation clock and ticks every (factory, stage)
 * once per step. Orders released by a stage are enqueued into the next stage
 * in the same tick.
 */
class SimulationDriver {
public:
	SimulationDriver(QueueManager* manager, SimClock* clock);

	// Registers factories and orders. Call once before ticking.
	absl::Status Load(const Workload& workload);

	// Runs one tick at clock->Now() without advancing the clock.
	TickReport Tick();

	void RunUntil(SimMinute until, SimMinute step, const std::function<void(const TickReport&)>& on_tick);

	size_t completed() const { return completed_; }

private:
	void Advance(Stage stage, const std::string& order_id, SimMinute now, TickReport* report);

	QueueManager* manager_;
	SimClock* clock_;
	Workload workload_;
	size_t next_arrival_ = 0;
	size_t next_hold_ = 0;
	size_t completed_ = 0;
};

} // namespace Wipflow
