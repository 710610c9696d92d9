#pragma once

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "queue/queue_store.h"

namespace Wipflow {

struct HoldRequest {
	std::string order_id;
	SimMinute hold_until_sim_minute = 0;
	std::string hold_reason;
};

struct HoldItemResult {
	std::string order_id;
	absl::Status status;
};

struct MultiHoldResult {
	size_t successful = 0;
	std::vector<HoldItemResult> items;
};

// Pending pool of one cycle split by hold state
struct HoldPartition {
	std::vector<QueueEntry> eligible;   // no hold, or hold auto-cleared this cycle
	std::vector<QueueEntry> on_hold;
	size_t cleared = 0;
};

/**
 * Temporary, reason-annotated suppression of release eligibility.
 * Holds live on the queue entries themselves; this class owns the rules.
 */
class HoldRegistry {
public:
	explicit HoldRegistry(IQueueStore* store);

	// Overwrites any existing hold and bumps hold_count.
	absl::StatusOr<QueueEntry> SetHold(Stage stage, const std::string& order_id,
			SimMinute hold_until_sim_minute, const std::string& reason, SimMinute now);

	// Nulls the hold fields, hold_count is kept.
	absl::StatusOr<QueueEntry> ClearHold(Stage stage, const std::string& order_id);

	// Best effort, one result per request.
	MultiHoldResult SetMultiple(Stage stage, const std::vector<HoldRequest>& holds, SimMinute now);

	// Expired holds are cleared in the store and their entries become eligible.
	HoldPartition PartitionEligible(Stage stage, const std::vector<QueueEntry>& entries, SimMinute now);

private:
	IQueueStore* store_;
};

} // namespace Wipflow
