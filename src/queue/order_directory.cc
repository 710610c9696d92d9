#include "queue/order_directory.h"

namespace Wipflow {

absl::Status OrderDirectory::Register(const OrderInfo& order) {
	if (order.order_id.empty()) {
		return absl::InvalidArgumentError("order id must not be empty");
	}
	if (order.factory_id.empty()) {
		return absl::InvalidArgumentError("order " + order.order_id + " has no factory");
	}
	absl::MutexLock lock(&mu_);
	orders_[order.order_id] = order;
	return absl::OkStatus();
}

std::optional<OrderInfo> OrderDirectory::Find(const std::string& order_id) const {
	absl::MutexLock lock(&mu_);
	auto it = orders_.find(order_id);
	if (it == orders_.end()) return std::nullopt;
	return it->second;
}

size_t OrderDirectory::size() const {
	absl::MutexLock lock(&mu_);
	return orders_.size();
}

void OrderDirectory::Clear() {
	absl::MutexLock lock(&mu_);
	orders_.clear();
}

} // namespace Wipflow
