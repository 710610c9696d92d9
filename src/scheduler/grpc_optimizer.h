#pragma once

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <optimizer.grpc.pb.h>

#include "scheduler/optimizer_bridge.h"

namespace Wipflow {

/**
 * Calls a remote wipflow.Optimizer service. The caller's timeout becomes
 * the RPC deadline.
 */
class GrpcOptimizer : public IOptimizer {
public:
	GrpcOptimizer(const std::string& endpoint, std::string label = "");
	// For tests and in-process servers
	GrpcOptimizer(const std::shared_ptr<grpc::Channel>& channel, std::string name);

	absl::StatusOr<wipflow::OptimizerResponse> Optimize(const wipflow::OptimizerRequest& request,
			absl::Duration timeout) override;
	std::string Name() const override { return name_; }

private:
	std::string name_;
	std::unique_ptr<wipflow::Optimizer::Stub> stub_;
};

} // namespace Wipflow
