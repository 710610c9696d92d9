#pragma once

#include <string>

#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "scheduler/optimizer_bridge.h"

namespace Wipflow {

/**
 * Runs an external optimizer command through /bin/sh -c.
 *
 * The request is written as JSON to the child's stdin and the response is read
 * as JSON from its stdout. A non-zero exit, a signal, oversized output or a
 * missed deadline is a failure; on timeout the child is killed.
 */
class ProcessOptimizer : public IOptimizer {
public:
	explicit ProcessOptimizer(std::string command, std::string label = "");

	absl::StatusOr<wipflow::OptimizerResponse> Optimize(const wipflow::OptimizerRequest& request,
			absl::Duration timeout) override;
	std::string Name() const override;

	// Raw command execution, exposed for tests.
	absl::StatusOr<std::string> Run(const std::string& input, absl::Duration timeout) const;

private:
	std::string command_;
	std::string label_;
};

} // namespace Wipflow
