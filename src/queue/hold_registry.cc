#include "queue/hold_registry.h"

#include <glog/logging.h>

namespace Wipflow {

HoldRegistry::HoldRegistry(IQueueStore* store) : store_(store) {
	CHECK(store_ != nullptr) << "HoldRegistry needs a queue store";
}

absl::StatusOr<QueueEntry> HoldRegistry::SetHold(Stage stage, const std::string& order_id,
		SimMinute hold_until_sim_minute, const std::string& reason, SimMinute now) {
	if (order_id.empty()) {
		return absl::InvalidArgumentError("hold requires an order id");
	}
	if (reason.empty()) {
		return absl::InvalidArgumentError("hold on " + order_id + " requires a reason");
	}
	auto updated = store_->UpdatePending(stage, order_id, [&](QueueEntry& entry) {
		entry.hold_until_sim_minute = hold_until_sim_minute;
		entry.hold_reason = reason;
		entry.hold_set_at_sim_minute = now;
		entry.hold_count++;
	});
	if (updated.ok()) {
		VLOG(1) << "\t[HoldRegistry] " << StageCode(stage) << " hold " << order_id
			<< " until " << hold_until_sim_minute << " (" << reason << ")";
	}
	return updated;
}

absl::StatusOr<QueueEntry> HoldRegistry::ClearHold(Stage stage, const std::string& order_id) {
	return store_->UpdatePending(stage, order_id, [](QueueEntry& entry) {
		entry.hold_until_sim_minute.reset();
		entry.hold_reason.reset();
		entry.hold_set_at_sim_minute.reset();
	});
}

MultiHoldResult HoldRegistry::SetMultiple(Stage stage, const std::vector<HoldRequest>& holds, SimMinute now) {
	MultiHoldResult result;
	result.items.reserve(holds.size());
	for (const HoldRequest& hold : holds) {
		auto applied = SetHold(stage, hold.order_id, hold.hold_until_sim_minute, hold.hold_reason, now);
		if (applied.ok()) {
			result.successful++;
		} else {
			LOG(WARNING) << "[HoldRegistry] " << StageCode(stage) << " hold on " << hold.order_id
				<< " failed: " << applied.status();
		}
		result.items.push_back(HoldItemResult{hold.order_id, applied.status()});
	}
	return result;
}

HoldPartition HoldRegistry::PartitionEligible(Stage stage, const std::vector<QueueEntry>& entries, SimMinute now) {
	HoldPartition partition;
	for (const QueueEntry& entry : entries) {
		if (entry.HasActiveHold(now)) {
			partition.on_hold.push_back(entry);
			continue;
		}
		if (entry.HasExpiredHold(now)) {
			auto cleared = ClearHold(stage, entry.order_id);
			if (!cleared.ok()) {
				// Entry vanished between snapshot and clear; it cannot be released either
				LOG(WARNING) << "[HoldRegistry] auto-clear of " << entry.order_id << " failed: " << cleared.status();
				continue;
			}
			partition.cleared++;
			partition.eligible.push_back(*cleared);
			continue;
		}
		partition.eligible.push_back(entry);
	}
	return partition;
}

} // namespace Wipflow
