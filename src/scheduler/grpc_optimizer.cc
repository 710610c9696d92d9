#include "scheduler/grpc_optimizer.h"

#include <glog/logging.h>

namespace Wipflow {

GrpcOptimizer::GrpcOptimizer(const std::string& endpoint, std::string label)
	: GrpcOptimizer(grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials()),
			label.empty() ? "grpc://" + endpoint : std::move(label)) {}

GrpcOptimizer::GrpcOptimizer(const std::shared_ptr<grpc::Channel>& channel, std::string name)
	: name_(std::move(name)), stub_(wipflow::Optimizer::NewStub(channel)) {}

absl::StatusOr<wipflow::OptimizerResponse> GrpcOptimizer::Optimize(const wipflow::OptimizerRequest& request,
		absl::Duration timeout) {
	grpc::ClientContext context;
	gpr_timespec deadline = gpr_time_add(
			gpr_now(GPR_CLOCK_REALTIME),
			gpr_time_from_millis(absl::ToInt64Milliseconds(timeout), GPR_TIMESPAN));
	context.set_deadline(deadline);

	wipflow::OptimizerResponse response;
	grpc::Status status = stub_->Optimize(&context, request, &response);
	if (!status.ok()) {
		VLOG(2) << "\t[GrpcOptimizer] " << name_ << " rpc failed: " << status.error_message();
		// grpc and absl share the canonical code space
		return absl::Status(static_cast<absl::StatusCode>(status.error_code()),
				"optimizer rpc failed: " + status.error_message());
	}
	return response;
}

} // namespace Wipflow
