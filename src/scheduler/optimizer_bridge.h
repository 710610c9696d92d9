#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include <optimizer.pb.h>

#include "queue/order_directory.h"
#include "queue/queue_entry.h"
#include "queue/stage_config_repository.h"

namespace Wipflow {

/**
 * Interface for a pluggable reordering-and-annotation algorithm.
 * Implementations must return within timeout or report DeadlineExceeded.
 */
class IOptimizer {
public:
	virtual ~IOptimizer() = default;

	virtual absl::StatusOr<wipflow::OptimizerResponse> Optimize(const wipflow::OptimizerRequest& request,
			absl::Duration timeout) = 0;
	virtual std::string Name() const = 0;
};

/**
 * Builds the optimizer input for a pending pool. Payload JSON text is parsed
 * into google.protobuf.Value; text that is not JSON is forwarded as a string.
 */
wipflow::OptimizerRequest BuildOptimizerRequest(const std::string& factory_id, Stage stage, SimMinute now,
		const std::vector<QueueEntry>& pool, const OrderDirectory& orders,
		const StageConfig& stage_config, const wipflow::StagePolicy& policy);

// Protobuf JSON mapping, lowerCamelCase field names
absl::StatusOr<std::string> OptimizerRequestToJson(const wipflow::OptimizerRequest& request);
// Unknown fields are ignored, malformed input is an error
absl::StatusOr<wipflow::OptimizerResponse> OptimizerResponseFromJson(const std::string& json);

struct ResponseValidation {
	int dropped_ids = 0;
	int dropped_etas = 0;
	int dropped_holds = 0;

	int total() const { return dropped_ids + dropped_etas + dropped_holds; }
};

// Removes items the core cannot act on: empty ids, non-finite ETAs, holds
// without a reason or ending at or before now.
ResponseValidation ValidateOptimizerResponse(wipflow::OptimizerResponse* response, SimMinute now);

struct OptimizerInvocation {
	bool invoked = false;
	bool failed = false;
	std::string optimizer;
	std::string error;
	int64_t duration_ms = 0;
	std::optional<wipflow::OptimizerResponse> response;   // set only on success
	ResponseValidation validation;
};

// Builds the optimizer for a stage's settings; nullptr for kNone.
std::shared_ptr<IOptimizer> MakeOptimizer(const OptimizerSettings& settings);

/**
 * Single call site for optimizers. Any failure (error status, exception,
 * timeout, malformed output) is logged and reported as "no result", never
 * propagated. No retries.
 */
class OptimizerBridge {
public:
	using OptimizerFactory = std::function<std::shared_ptr<IOptimizer>(const OptimizerSettings&)>;

	OptimizerBridge(OptimizerFactory factory, absl::Duration default_timeout);

	OptimizerInvocation Invoke(const OptimizerSettings& settings, const wipflow::OptimizerRequest& request,
			SimMinute now);

	absl::Duration default_timeout() const { return default_timeout_; }

private:
	std::shared_ptr<IOptimizer> Resolve(const OptimizerSettings& settings);

	OptimizerFactory factory_;
	absl::Duration default_timeout_;

	absl::Mutex mu_;
	// keyed by kind/command/endpoint so a config change builds a new optimizer
	absl::flat_hash_map<std::string, std::shared_ptr<IOptimizer>> cache_ ABSL_GUARDED_BY(mu_);
};

} // namespace Wipflow
