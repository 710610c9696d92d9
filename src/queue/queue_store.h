#pragma once

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "queue/queue_entry.h"

namespace Wipflow {

/**
 * Interface for per-stage queue persistence
 */
class IQueueStore {
public:
	virtual ~IQueueStore() = default;

	// Inserts a fresh pending entry. A pending entry for the same order makes
	// the call a no-op (skipped); a released one is retired first.
	virtual EnqueueOutcome Enqueue(Stage stage, const NewEntry& entry, SimMinute sim_minute) = 0;

	// Pending entries by (processing_order, queued_at). Empty factory_id lists all factories.
	virtual std::vector<QueueEntry> ListPending(Stage stage, const std::string& factory_id = "") const = 0;

	// Current entry (pending or released) for the order in this stage.
	virtual std::optional<QueueEntry> Find(Stage stage, const std::string& order_id) const = 0;

	virtual QueueStatus Status(Stage stage, SimMinute now) const = 0;

	// Marks the pending ones among order_ids. Returns the ids actually marked.
	virtual std::vector<std::string> MarkReleased(Stage stage,
			const std::vector<std::string>& order_ids, SimMinute sim_minute) = 0;

	// All-or-nothing: every release id must still be pending, otherwise nothing changes.
	virtual absl::Status CommitRelease(Stage stage, const ReleaseCommit& commit) = 0;

	virtual std::optional<int64_t> GetDispatchOrder(Stage stage, const std::string& order_id) const = 0;

	// Applies mutator to the pending entry of order_id under the store lock.
	virtual absl::StatusOr<QueueEntry> UpdatePending(Stage stage, const std::string& order_id,
			const std::function<void(QueueEntry&)>& mutator) = 0;

	virtual bool Remove(Stage stage, const std::string& order_id) = 0;
	virtual size_t ClearReleased(Stage stage) = 0;
	virtual void Clear() = 0;
};

class InMemoryQueueStore : public IQueueStore {
public:
	InMemoryQueueStore() = default;
	~InMemoryQueueStore() override = default;

	EnqueueOutcome Enqueue(Stage stage, const NewEntry& entry, SimMinute sim_minute) override;
	std::vector<QueueEntry> ListPending(Stage stage, const std::string& factory_id = "") const override;
	std::optional<QueueEntry> Find(Stage stage, const std::string& order_id) const override;
	QueueStatus Status(Stage stage, SimMinute now) const override;
	std::vector<std::string> MarkReleased(Stage stage,
			const std::vector<std::string>& order_ids, SimMinute sim_minute) override;
	absl::Status CommitRelease(Stage stage, const ReleaseCommit& commit) override;
	std::optional<int64_t> GetDispatchOrder(Stage stage, const std::string& order_id) const override;
	absl::StatusOr<QueueEntry> UpdatePending(Stage stage, const std::string& order_id,
			const std::function<void(QueueEntry&)>& mutator) override;
	bool Remove(Stage stage, const std::string& order_id) override;
	size_t ClearReleased(Stage stage) override;
	void Clear() override;

private:
	struct StageTable {
		// Released entries stay here until re-enqueue or ClearReleased.
		absl::flat_hash_map<std::string, QueueEntry> entries;
		// processing_order -> order_id, pending entries only
		absl::btree_map<int64_t, std::string> pending_index;
		absl::flat_hash_map<std::string, int64_t> dispatch_order;
		int64_t high_water = 0;
	};

	StageTable& Table(Stage stage) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
		return tables_[StageIndex(stage)];
	}
	const StageTable& Table(Stage stage) const ABSL_SHARED_LOCKS_REQUIRED(mu_) {
		return tables_[StageIndex(stage)];
	}

	void MarkLocked(StageTable& table, QueueEntry& entry, SimMinute sim_minute)
		ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

	mutable absl::Mutex mu_;
	std::array<StageTable, kNumStages> tables_ ABSL_GUARDED_BY(mu_);
	uint64_t next_id_ ABSL_GUARDED_BY(mu_) = 1;
};

} // namespace Wipflow
