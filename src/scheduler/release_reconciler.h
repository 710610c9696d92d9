#pragma once

#include <string>
#include <vector>

#include "absl/status/status.h"

#include <optimizer.pb.h>
#include <scheduling_log.pb.h>

#include "common/sim_clock.h"
#include "queue/queue_store.h"
#include "scheduler/delivery_date_store.h"

namespace Wipflow {

/**
 * Optimizer ranking: release_list when non-empty, else batch members in batch
 * order. Duplicates keep their first position. Null response -> empty ranking.
 */
std::vector<std::string> RankingFromResponse(const wipflow::OptimizerResponse* response);

/**
 * Stable reorder of entries by rank. Unranked entries follow all ranked ones in
 * their original relative order; ranked ids with no local entry are ignored.
 */
std::vector<QueueEntry> ReconcileOrder(const std::vector<QueueEntry>& entries,
		const std::vector<std::string>& ranking);

// Positions where reconciled differs from fifo (same length lists).
int CountReorders(const std::vector<std::string>& reconciled, const std::vector<std::string>& fifo);

// Elementwise mismatches plus the absolute length difference.
int CountDiffs(const std::vector<std::string>& reconciled, const std::vector<std::string>& raw);

// Normalized process steps named in a possible_sequence JSON document.
std::vector<std::string> ExtractProcessSteps(const std::string& possible_sequence);

double JaccardSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Size and mean pairwise step similarity of the first `limit` batches.
std::vector<wipflow::BatchInsight> BuildBatchInsights(const wipflow::OptimizerResponse& response,
		const std::vector<QueueEntry>& pool, size_t limit);

struct ReleasePlan {
	std::vector<std::string> ranking;          // raw optimizer ranking
	std::vector<std::string> reconciled_pool;  // whole pool, reconciled order
	std::vector<std::string> release_ids;      // eligible entries, reconciled order
	std::vector<std::string> dispatch_sequence;
	int reorder_count = 0;
	int diff_count = 0;
};

struct EtaPropagation {
	int written = 0;
	int failed = 0;
	int skipped = 0;   // non-positive ETA or id not in the pool
};

class ReleaseReconciler {
public:
	ReleaseReconciler(IQueueStore* store, IDeliveryDateStore* delivery_dates, const SimClock* clock);

	// pool: the whole pending pool; eligible: the subset allowed to release now.
	ReleasePlan Plan(Stage stage, const std::vector<QueueEntry>& pool,
			const std::vector<QueueEntry>& eligible, const wipflow::OptimizerResponse* response) const;

	// Release marks and dispatch sequence in one store transaction.
	absl::Status Commit(Stage stage, const ReleasePlan& plan, SimMinute now);

	// Per order best effort; never fails as a whole.
	EtaPropagation PropagateEtas(Stage stage, const std::vector<QueueEntry>& pool,
			const wipflow::OptimizerResponse& response, const std::string& optimizer, SimMinute now);

private:
	IQueueStore* store_;
	IDeliveryDateStore* delivery_dates_;
	const SimClock* clock_;
};

} // namespace Wipflow
