#include "scheduler/release_reconciler.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

#include <glog/logging.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_format.h"

namespace Wipflow {

namespace {

std::vector<std::string> Ids(const std::vector<QueueEntry>& entries) {
	std::vector<std::string> ids;
	ids.reserve(entries.size());
	for (const QueueEntry& entry : entries) ids.push_back(entry.order_id);
	return ids;
}

std::optional<std::string> NormalizeStep(std::string step) {
	if (absl::StartsWithIgnoreCase(step, "BGT-")) {
		step = step.substr(4);
	} else if (absl::StartsWithIgnoreCase(step, "BG-")) {
		step = step.substr(3);
	}
	std::string cleaned(absl::StripAsciiWhitespace(step));
	if (cleaned.empty() || cleaned == "I" || cleaned == "Q" || cleaned == "×") {
		return std::nullopt;
	}
	return cleaned;
}

void CollectSteps(const google::protobuf::Value& value, bool in_steps, absl::btree_set<std::string>* steps) {
	switch (value.kind_case()) {
		case google::protobuf::Value::kStringValue:
			if (in_steps) {
				if (auto step = NormalizeStep(value.string_value())) steps->insert(*step);
			}
			break;
		case google::protobuf::Value::kNumberValue:
			if (in_steps) {
				if (auto step = NormalizeStep(absl::StrFormat("%g", value.number_value()))) steps->insert(*step);
			}
			break;
		case google::protobuf::Value::kListValue:
			for (const auto& item : value.list_value().values()) {
				CollectSteps(item, in_steps, steps);
			}
			break;
		case google::protobuf::Value::kStructValue:
			for (const auto& field : value.struct_value().fields()) {
				CollectSteps(field.second, field.first == "steps", steps);
			}
			break;
		default:
			break;
	}
}

} // namespace

std::vector<std::string> RankingFromResponse(const wipflow::OptimizerResponse* response) {
	std::vector<std::string> ranking;
	if (response == nullptr) return ranking;
	absl::flat_hash_set<std::string> seen;
	auto add = [&](const std::string& id) {
		if (seen.insert(id).second) ranking.push_back(id);
	};
	if (response->release_list_size() > 0) {
		for (const std::string& id : response->release_list()) add(id);
	} else {
		for (const wipflow::Batch& batch : response->batches()) {
			for (const std::string& id : batch.order_ids()) add(id);
		}
	}
	return ranking;
}

std::vector<QueueEntry> ReconcileOrder(const std::vector<QueueEntry>& entries,
		const std::vector<std::string>& ranking) {
	absl::flat_hash_map<std::string, size_t> rank;
	for (size_t i = 0; i < ranking.size(); ++i) {
		rank.try_emplace(ranking[i], i);
	}
	std::vector<QueueEntry> ordered = entries;
	std::stable_sort(ordered.begin(), ordered.end(), [&rank](const QueueEntry& a, const QueueEntry& b) {
		auto ra = rank.find(a.order_id);
		auto rb = rank.find(b.order_id);
		size_t ka = ra == rank.end() ? std::numeric_limits<size_t>::max() : ra->second;
		size_t kb = rb == rank.end() ? std::numeric_limits<size_t>::max() : rb->second;
		return ka < kb;
	});
	return ordered;
}

int CountReorders(const std::vector<std::string>& reconciled, const std::vector<std::string>& fifo) {
	int count = 0;
	size_t n = std::min(reconciled.size(), fifo.size());
	for (size_t i = 0; i < n; ++i) {
		if (reconciled[i] != fifo[i]) count++;
	}
	return count;
}

int CountDiffs(const std::vector<std::string>& reconciled, const std::vector<std::string>& raw) {
	size_t n = std::min(reconciled.size(), raw.size());
	int count = 0;
	for (size_t i = 0; i < n; ++i) {
		if (reconciled[i] != raw[i]) count++;
	}
	size_t longer = std::max(reconciled.size(), raw.size());
	return count + static_cast<int>(longer - n);
}

std::vector<std::string> ExtractProcessSteps(const std::string& possible_sequence) {
	if (possible_sequence.empty()) return {};
	google::protobuf::Value value;
	google::protobuf::util::JsonParseOptions options;
	if (!google::protobuf::util::JsonStringToMessage(possible_sequence, &value, options).ok()) {
		return {};
	}
	absl::btree_set<std::string> steps;
	// A bare list is read as the step list itself
	CollectSteps(value, value.kind_case() == google::protobuf::Value::kListValue, &steps);
	return std::vector<std::string>(steps.begin(), steps.end());
}

double JaccardSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b) {
	absl::flat_hash_set<std::string> set_a(a.begin(), a.end());
	absl::flat_hash_set<std::string> set_b(b.begin(), b.end());
	if (set_a.empty() && set_b.empty()) return 0.0;
	size_t intersection = 0;
	for (const std::string& step : set_a) {
		if (set_b.contains(step)) intersection++;
	}
	size_t union_size = set_a.size() + set_b.size() - intersection;
	return union_size == 0 ? 0.0 : static_cast<double>(intersection) / union_size;
}

std::vector<wipflow::BatchInsight> BuildBatchInsights(const wipflow::OptimizerResponse& response,
		const std::vector<QueueEntry>& pool, size_t limit) {
	absl::flat_hash_map<std::string, std::vector<std::string>> steps_by_order;
	for (const QueueEntry& entry : pool) {
		steps_by_order[entry.order_id] = ExtractProcessSteps(entry.possible_sequence);
	}

	std::vector<wipflow::BatchInsight> insights;
	for (const wipflow::Batch& batch : response.batches()) {
		if (insights.size() >= limit) break;
		std::vector<const std::vector<std::string>*> sets;
		static const std::vector<std::string> kNoSteps;
		for (const std::string& id : batch.order_ids()) {
			auto it = steps_by_order.find(id);
			sets.push_back(it == steps_by_order.end() ? &kNoSteps : &it->second);
		}
		double sum = 0;
		int pairs = 0;
		for (size_t i = 0; i < sets.size(); ++i) {
			for (size_t j = i + 1; j < sets.size(); ++j) {
				sum += JaccardSimilarity(*sets[i], *sets[j]);
				pairs++;
			}
		}

		wipflow::BatchInsight insight;
		insight.set_id(batch.id());
		insight.set_size(batch.order_ids_size());
		insight.set_jaccard(pairs > 0 ? sum / pairs : 0.0);
		if (batch.has_release_at()) {
			insight.set_release_at(batch.release_at());
		} else if (batch.has_window() && batch.window().has_earliest()) {
			insight.set_release_at(batch.window().earliest());
		}
		insights.push_back(std::move(insight));
	}
	return insights;
}

ReleaseReconciler::ReleaseReconciler(IQueueStore* store, IDeliveryDateStore* delivery_dates,
		const SimClock* clock)
	: store_(store), delivery_dates_(delivery_dates), clock_(clock) {
	CHECK(store_ != nullptr) << "ReleaseReconciler needs a queue store";
}

ReleasePlan ReleaseReconciler::Plan(Stage stage, const std::vector<QueueEntry>& pool,
		const std::vector<QueueEntry>& eligible, const wipflow::OptimizerResponse* response) const {
	ReleasePlan plan;
	plan.ranking = RankingFromResponse(response);
	plan.reconciled_pool = Ids(ReconcileOrder(pool, plan.ranking));

	absl::flat_hash_set<std::string> eligible_ids;
	for (const QueueEntry& entry : eligible) eligible_ids.insert(entry.order_id);
	for (const std::string& id : plan.reconciled_pool) {
		if (eligible_ids.contains(id)) plan.release_ids.push_back(id);
	}

	// PAP ranks its whole pool for downstream; later stages rank what they release
	plan.dispatch_sequence = stage == Stage::kPreAcceptance ? plan.reconciled_pool : plan.release_ids;

	std::vector<std::string> fifo;
	for (const QueueEntry& entry : pool) {
		if (eligible_ids.contains(entry.order_id)) fifo.push_back(entry.order_id);
	}
	plan.reorder_count = CountReorders(plan.release_ids, fifo);
	plan.diff_count = plan.ranking.empty() ? 0 : CountDiffs(plan.release_ids, plan.ranking);
	return plan;
}

absl::Status ReleaseReconciler::Commit(Stage stage, const ReleasePlan& plan, SimMinute now) {
	ReleaseCommit commit;
	commit.release_ids = plan.release_ids;
	commit.dispatch_sequence = plan.dispatch_sequence;
	commit.sim_minute = now;
	return store_->CommitRelease(stage, commit);
}

EtaPropagation ReleaseReconciler::PropagateEtas(Stage stage, const std::vector<QueueEntry>& pool,
		const wipflow::OptimizerResponse& response, const std::string& optimizer, SimMinute now) {
	EtaPropagation result;
	if (delivery_dates_ == nullptr) return result;

	absl::flat_hash_set<std::string> pool_ids;
	for (const QueueEntry& entry : pool) pool_ids.insert(entry.order_id);
	absl::flat_hash_set<std::string> done;

	for (const wipflow::EtaPrediction& eta : response.eta_list()) {
		if (!std::isfinite(eta.eta()) || eta.eta() <= 0 || !pool_ids.contains(eta.order_id()) ||
				!done.insert(eta.order_id()).second) {
			result.skipped++;
			continue;
		}

		DeliveryDateRecord record;
		record.order_id = eta.order_id();
		record.stage = stage;
		record.optimizer = optimizer;
		record.eta_minutes = eta.eta();
		record.computed_at_sim_minute = now;
		record.eta_sim_minute = static_cast<double>(now) + eta.eta();
		if (clock_ != nullptr) record.calendar_date = clock_->ToCalendar(record.eta_sim_minute);
		if (eta.has_lower()) record.lower = eta.lower();
		if (eta.has_upper()) record.upper = eta.upper();
		if (eta.has_confidence()) record.confidence = eta.confidence();

		absl::StatusOr<int> superseded = delivery_dates_->ReplaceCurrent(record);
		if (!superseded.ok()) {
			LOG(WARNING) << "[ReleaseReconciler] delivery date of " << eta.order_id()
				<< " not written: " << superseded.status();
			result.failed++;
			continue;
		}
		VLOG(3) << "\t[ReleaseReconciler] " << eta.order_id() << " eta " << record.eta_sim_minute
			<< " superseded " << *superseded;
		result.written++;
	}
	VLOG(2) << "\t[ReleaseReconciler] " << StageCode(stage) << " eta written=" << result.written
		<< " failed=" << result.failed << " skipped=" << result.skipped;
	return result;
}

} // namespace Wipflow
