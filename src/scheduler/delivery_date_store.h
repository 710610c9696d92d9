#pragma once

#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include "common/stage.h"

namespace Wipflow {

struct DeliveryDateRecord {
	uint64_t id = 0;   // assigned by the store
	std::string order_id;
	Stage stage = Stage::kPreAcceptance;
	std::string optimizer;
	double eta_minutes = 0;         // relative to computed_at
	double eta_sim_minute = 0;      // computed_at + eta_minutes
	SimMinute computed_at_sim_minute = 0;
	std::optional<absl::Time> calendar_date;
	std::optional<double> lower;
	std::optional<double> upper;
	std::optional<double> confidence;
	bool is_current = true;
};

/**
 * Downstream delivery estimates, keyed by order id. At most one record per
 * order is current; older ones are kept as history.
 */
class IDeliveryDateStore {
public:
	virtual ~IDeliveryDateStore() = default;

	// Supersedes the order's current record (if any) and inserts this one as
	// current, as one step. On error the previous current record is kept.
	// Returns the number of records superseded.
	virtual absl::StatusOr<int> ReplaceCurrent(const DeliveryDateRecord& record) = 0;

	virtual std::optional<DeliveryDateRecord> Current(const std::string& order_id) const = 0;
	virtual std::vector<DeliveryDateRecord> History(const std::string& order_id) const = 0;
};

class InMemoryDeliveryDateStore : public IDeliveryDateStore {
public:
	absl::StatusOr<int> ReplaceCurrent(const DeliveryDateRecord& record) override;
	std::optional<DeliveryDateRecord> Current(const std::string& order_id) const override;
	std::vector<DeliveryDateRecord> History(const std::string& order_id) const override;

private:
	mutable absl::Mutex mu_;
	absl::flat_hash_map<std::string, std::vector<DeliveryDateRecord>> records_ ABSL_GUARDED_BY(mu_);
	uint64_t next_id_ ABSL_GUARDED_BY(mu_) = 1;
};

} // namespace Wipflow
