#include "queue/queue_store.h"

#include <algorithm>
#include <glog/logging.h>

namespace Wipflow {

EnqueueOutcome InMemoryQueueStore::Enqueue(Stage stage, const NewEntry& entry, SimMinute sim_minute) {
	absl::MutexLock lock(&mu_);
	StageTable& table = Table(stage);

	auto it = table.entries.find(entry.order_id);
	if (it != table.entries.end()) {
		if (it->second.IsPending()) {
			VLOG(2) << "\t[QueueStore] " << StageCode(stage) << " order " << entry.order_id
				<< " already pending, skipped";
			return EnqueueOutcome{true, it->second};
		}
		// Retire the released entry before inserting the fresh one
		table.dispatch_order.erase(entry.order_id);
		table.entries.erase(it);
	}

	QueueEntry fresh;
	fresh.id = next_id_++;
	fresh.order_id = entry.order_id;
	fresh.factory_id = entry.factory_id;
	fresh.stage = stage;
	fresh.possible_sequence = entry.possible_sequence;
	fresh.process_times = entry.process_times;
	fresh.processing_order = ++table.high_water;
	fresh.queued_at_sim_minute = sim_minute;
	fresh.release_after_minutes = entry.release_after_minutes;

	table.pending_index.emplace(fresh.processing_order, fresh.order_id);
	auto inserted = table.entries.emplace(fresh.order_id, std::move(fresh));
	return EnqueueOutcome{false, inserted.first->second};
}

std::vector<QueueEntry> InMemoryQueueStore::ListPending(Stage stage, const std::string& factory_id) const {
	absl::MutexLock lock(&mu_);
	const StageTable& table = Table(stage);
	std::vector<QueueEntry> result;
	result.reserve(table.pending_index.size());
	// processing_order is unique per stage, so index order is (processing_order, queued_at) order
	for (const auto& [order, order_id] : table.pending_index) {
		const QueueEntry& entry = table.entries.at(order_id);
		if (factory_id.empty() || entry.factory_id == factory_id) {
			result.push_back(entry);
		}
	}
	return result;
}

std::optional<QueueEntry> InMemoryQueueStore::Find(Stage stage, const std::string& order_id) const {
	absl::MutexLock lock(&mu_);
	const StageTable& table = Table(stage);
	auto it = table.entries.find(order_id);
	if (it == table.entries.end()) return std::nullopt;
	return it->second;
}

QueueStatus InMemoryQueueStore::Status(Stage stage, SimMinute now) const {
	QueueStatus status;
	for (QueueEntry& entry : ListPending(stage)) {
		EntryStatus item;
		item.release_at_sim_minute = entry.ReleaseAtSimMinute();
		item.wait_minutes = std::max<SimMinute>(0, item.release_at_sim_minute - now);
		item.is_ready = item.wait_minutes == 0;
		item.on_hold = entry.HasActiveHold(now);
		item.entry = std::move(entry);
		if (item.is_ready) status.ready_count++;
		status.entries.push_back(std::move(item));
	}
	status.total_count = status.entries.size();
	return status;
}

void InMemoryQueueStore::MarkLocked(StageTable& table, QueueEntry& entry, SimMinute sim_minute) {
	entry.released_at_sim_minute = sim_minute;
	table.pending_index.erase(entry.processing_order);
}

std::vector<std::string> InMemoryQueueStore::MarkReleased(Stage stage,
		const std::vector<std::string>& order_ids, SimMinute sim_minute) {
	absl::MutexLock lock(&mu_);
	StageTable& table = Table(stage);
	std::vector<std::string> marked;
	for (const std::string& order_id : order_ids) {
		auto it = table.entries.find(order_id);
		if (it == table.entries.end() || !it->second.IsPending()) {
			VLOG(3) << "\t[QueueStore] " << StageCode(stage) << " order " << order_id << " not pending, ignored";
			continue;
		}
		MarkLocked(table, it->second, sim_minute);
		marked.push_back(order_id);
	}
	return marked;
}

absl::Status InMemoryQueueStore::CommitRelease(Stage stage, const ReleaseCommit& commit) {
	absl::MutexLock lock(&mu_);
	StageTable& table = Table(stage);

	for (const std::string& order_id : commit.release_ids) {
		auto it = table.entries.find(order_id);
		if (it == table.entries.end() || !it->second.IsPending()) {
			return absl::AbortedError("order " + order_id + " is no longer pending in " + StageCode(stage));
		}
	}

	for (const std::string& order_id : commit.release_ids) {
		MarkLocked(table, table.entries.at(order_id), commit.sim_minute);
	}
	int64_t rank = 1;
	for (const std::string& order_id : commit.dispatch_sequence) {
		table.dispatch_order[order_id] = rank++;
	}
	return absl::OkStatus();
}

std::optional<int64_t> InMemoryQueueStore::GetDispatchOrder(Stage stage, const std::string& order_id) const {
	absl::MutexLock lock(&mu_);
	const StageTable& table = Table(stage);
	auto it = table.dispatch_order.find(order_id);
	if (it == table.dispatch_order.end()) return std::nullopt;
	return it->second;
}

absl::StatusOr<QueueEntry> InMemoryQueueStore::UpdatePending(Stage stage, const std::string& order_id,
		const std::function<void(QueueEntry&)>& mutator) {
	absl::MutexLock lock(&mu_);
	StageTable& table = Table(stage);
	auto it = table.entries.find(order_id);
	if (it == table.entries.end() || !it->second.IsPending()) {
		return absl::NotFoundError("no pending entry for order " + order_id + " in " + StageName(stage));
	}
	mutator(it->second);
	return it->second;
}

bool InMemoryQueueStore::Remove(Stage stage, const std::string& order_id) {
	absl::MutexLock lock(&mu_);
	StageTable& table = Table(stage);
	auto it = table.entries.find(order_id);
	if (it == table.entries.end() || !it->second.IsPending()) return false;
	table.pending_index.erase(it->second.processing_order);
	table.dispatch_order.erase(order_id);
	table.entries.erase(it);
	return true;
}

size_t InMemoryQueueStore::ClearReleased(Stage stage) {
	absl::MutexLock lock(&mu_);
	StageTable& table = Table(stage);
	size_t removed = 0;
	for (auto it = table.entries.begin(); it != table.entries.end();) {
		if (!it->second.IsPending()) {
			table.dispatch_order.erase(it->first);
			table.entries.erase(it++);
			removed++;
		} else {
			++it;
		}
	}
	return removed;
}

void InMemoryQueueStore::Clear() {
	absl::MutexLock lock(&mu_);
	for (StageTable& table : tables_) {
		table = StageTable{};
	}
}

} // namespace Wipflow
