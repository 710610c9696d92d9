#pragma once

#include <string>
#include <vector>

#include "absl/status/statusor.h"

#include "queue/order_directory.h"
#include "common/stage.h"

namespace Wipflow {

struct WorkloadOrder {
	OrderInfo info;
	SimMinute arrival = 0;   // enqueued into PAP at this minute
};

// Hold placed by the driver at a given minute
struct ScriptedHold {
	Stage stage = Stage::kPreAcceptance;
	std::string order_id;
	SimMinute at = 0;
	SimMinute until = 0;
	std::string reason;
};

struct Workload {
	std::vector<std::string> factories;
	std::vector<WorkloadOrder> orders;   // sorted by arrival
	std::vector<ScriptedHold> holds;     // sorted by at
};

/**
 * Reads a workload YAML document:
 *
 *   workload:
 *     factories: [F1]
 *     orders:
 *       - {id: O1, factory: F1, arrival: 0, due_date: "2025-01-10",
 *          possible_sequence: '{"baugruppen": {...}}'}
 *     holds:
 *       - {stage: PAP, order: O1, at: 10, until: 40, reason: capacity}
 *
 * Factories referenced by orders are added to the factory list.
 */
absl::StatusOr<Workload> LoadWorkloadFromFile(const std::string& path);
absl::StatusOr<Workload> LoadWorkloadFromString(const std::string& yaml_content);

} // namespace Wipflow
