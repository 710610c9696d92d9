#ifndef WIPFLOW_QUEUE_ORDER_DIRECTORY_H_
#define WIPFLOW_QUEUE_ORDER_DIRECTORY_H_

#include <optional>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"

namespace Wipflow {

// Business-side facts about an order that the scheduler needs but does not own.
struct OrderInfo {
	std::string order_id;
	std::string factory_id;
	std::optional<std::string> due_date;
	std::optional<std::string> created_at;
	std::optional<std::string> product_group;
	std::optional<std::string> product_variant;
	// Defaults for enqueue when the caller supplies no payload (JSON text)
	std::string possible_sequence;
	std::string process_times;
};

class OrderDirectory {
public:
	OrderDirectory() = default;

	// Re-registering an order replaces its info.
	absl::Status Register(const OrderInfo& order);
	std::optional<OrderInfo> Find(const std::string& order_id) const;
	size_t size() const;
	void Clear();

private:
	mutable absl::Mutex mu_;
	absl::flat_hash_map<std::string, OrderInfo> orders_ ABSL_GUARDED_BY(mu_);
};

} // namespace Wipflow

#endif // WIPFLOW_QUEUE_ORDER_DIRECTORY_H_
