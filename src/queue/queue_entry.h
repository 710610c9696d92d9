#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/stage.h"

namespace Wipflow {

/**
 * One work item waiting in (or released from) a stage queue.
 *
 * possible_sequence and process_times are opaque JSON text forwarded to the
 * optimizer as-is. An empty string means "not provided".
 */
struct QueueEntry {
	uint64_t id = 0;
	std::string order_id;
	std::string factory_id;
	Stage stage = Stage::kPreAcceptance;

	std::string possible_sequence;
	std::string process_times;

	int64_t processing_order = 0;
	SimMinute queued_at_sim_minute = 0;
	int release_after_minutes = 0;
	std::optional<SimMinute> released_at_sim_minute;

	std::optional<SimMinute> hold_until_sim_minute;
	std::optional<std::string> hold_reason;
	std::optional<SimMinute> hold_set_at_sim_minute;
	int hold_count = 0;

	bool IsPending() const { return !released_at_sim_minute.has_value(); }

	// A hold is active while now < hold_until; at hold_until it has expired.
	bool HasActiveHold(SimMinute now) const {
		return hold_until_sim_minute.has_value() && *hold_until_sim_minute > now;
	}

	bool HasExpiredHold(SimMinute now) const {
		return hold_until_sim_minute.has_value() && *hold_until_sim_minute <= now;
	}

	SimMinute ReleaseAtSimMinute() const {
		return queued_at_sim_minute + release_after_minutes;
	}
};

// Caller-provided part of a new entry; the store assigns the rest.
struct NewEntry {
	std::string order_id;
	std::string factory_id;
	std::string possible_sequence;
	std::string process_times;
	int release_after_minutes = 0;
};

struct EnqueueOutcome {
	bool skipped = false;
	QueueEntry entry;   // the existing pending entry when skipped
};

struct EntryStatus {
	QueueEntry entry;
	bool is_ready = false;
	bool on_hold = false;
	SimMinute wait_minutes = 0;
	SimMinute release_at_sim_minute = 0;
};

struct QueueStatus {
	size_t total_count = 0;
	size_t ready_count = 0;
	std::vector<EntryStatus> entries;
};

/**
 * Everything one release cycle persists as a single unit: the release marks
 * and the dispatch sequence (rank 1..N in list order).
 */
struct ReleaseCommit {
	std::vector<std::string> release_ids;
	std::vector<std::string> dispatch_sequence;
	SimMinute sim_minute = 0;
};

} // namespace Wipflow
