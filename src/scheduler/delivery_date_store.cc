#include "scheduler/delivery_date_store.h"

#include <cmath>

namespace Wipflow {

absl::StatusOr<int> InMemoryDeliveryDateStore::ReplaceCurrent(const DeliveryDateRecord& record) {
	if (record.order_id.empty()) {
		return absl::InvalidArgumentError("delivery date record needs an order id");
	}
	if (!std::isfinite(record.eta_minutes) || record.eta_minutes <= 0) {
		return absl::InvalidArgumentError("delivery date of " + record.order_id + " needs a positive finite eta");
	}
	absl::MutexLock lock(&mu_);
	std::vector<DeliveryDateRecord>& history = records_[record.order_id];
	int superseded = 0;
	for (DeliveryDateRecord& existing : history) {
		if (existing.is_current) {
			existing.is_current = false;
			superseded++;
		}
	}
	DeliveryDateRecord inserted = record;
	inserted.id = next_id_++;
	inserted.is_current = true;
	history.push_back(std::move(inserted));
	return superseded;
}

std::optional<DeliveryDateRecord> InMemoryDeliveryDateStore::Current(const std::string& order_id) const {
	absl::MutexLock lock(&mu_);
	auto it = records_.find(order_id);
	if (it == records_.end()) return std::nullopt;
	for (const DeliveryDateRecord& record : it->second) {
		if (record.is_current) return record;
	}
	return std::nullopt;
}

std::vector<DeliveryDateRecord> InMemoryDeliveryDateStore::History(const std::string& order_id) const {
	absl::MutexLock lock(&mu_);
	auto it = records_.find(order_id);
	if (it == records_.end()) return {};
	return it->second;
}

} // namespace Wipflow
