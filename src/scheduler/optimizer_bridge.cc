#include "scheduler/optimizer_bridge.h"

#include <cmath>
#include <exception>
#include <limits>

#include <glog/logging.h>
#include <google/protobuf/util/json_util.h>

#include "scheduler/grpc_optimizer.h"
#include "scheduler/process_optimizer.h"

namespace Wipflow {

namespace {

void SetJsonValue(const std::string& text, google::protobuf::Value* value) {
	if (text.empty()) return;
	google::protobuf::util::JsonParseOptions options;
	auto status = google::protobuf::util::JsonStringToMessage(text, value, options);
	if (!status.ok()) {
		VLOG(3) << "\t[OptimizerBridge] payload is not JSON, forwarding as string";
		value->set_string_value(text);
	}
}

template<typename T>
int DropIf(google::protobuf::RepeatedPtrField<T>* items, const std::function<bool(const T&)>& drop) {
	google::protobuf::RepeatedPtrField<T> kept;
	int dropped = 0;
	for (T& item : *items) {
		if (drop(item)) {
			dropped++;
			continue;
		}
		*kept.Add() = std::move(item);
	}
	items->Swap(&kept);
	return dropped;
}

// Wire minutes are int32; out-of-range values saturate instead of wrapping
int32_t ToWireMinute(int64_t minute) {
	constexpr int64_t kMax = std::numeric_limits<int32_t>::max();
	constexpr int64_t kMin = std::numeric_limits<int32_t>::min();
	if (minute > kMax || minute < kMin) {
		LOG_FIRST_N(WARNING, 1) << "[OptimizerBridge] sim minute " << minute
			<< " exceeds the optimizer wire range, clamped";
		return static_cast<int32_t>(minute > kMax ? kMax : kMin);
	}
	return static_cast<int32_t>(minute);
}

std::string CacheKey(const OptimizerSettings& settings) {
	return std::string(OptimizerKindName(settings.kind)) + "|" + settings.command + "|" +
		settings.endpoint + "|" + settings.label;
}

} // namespace

wipflow::OptimizerRequest BuildOptimizerRequest(const std::string& factory_id, Stage stage, SimMinute now,
		const std::vector<QueueEntry>& pool, const OrderDirectory& orders,
		const StageConfig& stage_config, const wipflow::StagePolicy& policy) {
	wipflow::OptimizerRequest request;
	request.set_now(ToWireMinute(now));
	request.set_stage(StageCode(stage));
	request.set_factory_id(factory_id);

	for (const QueueEntry& entry : pool) {
		wipflow::OptimizerOrder* order = request.add_orders();
		order->set_id(entry.order_id);
		SetJsonValue(entry.possible_sequence, order->mutable_payload()->mutable_possible_sequence());
		SetJsonValue(entry.process_times, order->mutable_payload()->mutable_process_times());

		wipflow::OrderMeta* meta = order->mutable_meta();
		meta->set_queued_at(ToWireMinute(entry.queued_at_sim_minute));
		meta->set_processing_order(ToWireMinute(entry.processing_order));
		if (entry.hold_until_sim_minute) {
			meta->set_hold_until(ToWireMinute(*entry.hold_until_sim_minute));
		}
		std::optional<OrderInfo> info = orders.Find(entry.order_id);
		if (info) {
			if (info->due_date) meta->set_due_date(*info->due_date);
			if (info->created_at) meta->set_created_at(*info->created_at);
			if (info->product_group) meta->set_product_group(*info->product_group);
			if (info->product_variant) meta->set_product_variant(*info->product_variant);
		}
	}

	*request.mutable_config() = policy;
	request.mutable_config()->set_release_after_minutes(stage_config.release_after_minutes);
	return request;
}

absl::StatusOr<std::string> OptimizerRequestToJson(const wipflow::OptimizerRequest& request) {
	google::protobuf::util::JsonPrintOptions options;
	options.add_whitespace = false;
	options.always_print_primitive_fields = true;
	std::string json;
	auto status = google::protobuf::util::MessageToJsonString(request, &json, options);
	if (!status.ok()) {
		return absl::InternalError("cannot serialize optimizer request: " + status.ToString());
	}
	return json;
}

absl::StatusOr<wipflow::OptimizerResponse> OptimizerResponseFromJson(const std::string& json) {
	wipflow::OptimizerResponse response;
	google::protobuf::util::JsonParseOptions options;
	options.ignore_unknown_fields = true;
	auto status = google::protobuf::util::JsonStringToMessage(json, &response, options);
	if (!status.ok()) {
		return absl::DataLossError("malformed optimizer output: " + status.ToString());
	}
	return response;
}

ResponseValidation ValidateOptimizerResponse(wipflow::OptimizerResponse* response, SimMinute now) {
	ResponseValidation validation;
	auto empty_id = [](const std::string& id) { return id.empty(); };

	validation.dropped_ids += DropIf<std::string>(response->mutable_release_list(), empty_id);
	for (wipflow::Batch& batch : *response->mutable_batches()) {
		validation.dropped_ids += DropIf<std::string>(batch.mutable_order_ids(), empty_id);
	}

	validation.dropped_etas = DropIf<wipflow::EtaPrediction>(response->mutable_eta_list(),
			[](const wipflow::EtaPrediction& eta) {
				return eta.order_id().empty() || !std::isfinite(eta.eta());
			});

	validation.dropped_holds = DropIf<wipflow::HoldDecision>(response->mutable_hold_decisions(),
			[now](const wipflow::HoldDecision& hold) {
				return hold.order_id().empty() || hold.hold_reason().empty() ||
					!std::isfinite(hold.hold_until_sim_minute()) ||
					hold.hold_until_sim_minute() <= static_cast<double>(now);
			});
	return validation;
}

std::shared_ptr<IOptimizer> MakeOptimizer(const OptimizerSettings& settings) {
	switch (settings.kind) {
		case OptimizerKind::kNone:
			return nullptr;
		case OptimizerKind::kProcess:
			if (settings.command.empty()) {
				LOG(ERROR) << "Process optimizer configured without a command";
				return nullptr;
			}
			return std::make_shared<ProcessOptimizer>(settings.command, settings.label);
		case OptimizerKind::kGrpc:
			if (settings.endpoint.empty()) {
				LOG(ERROR) << "gRPC optimizer configured without an endpoint";
				return nullptr;
			}
			return std::make_shared<GrpcOptimizer>(settings.endpoint, settings.label);
	}
	return nullptr;
}

OptimizerBridge::OptimizerBridge(OptimizerFactory factory, absl::Duration default_timeout)
	: factory_(std::move(factory)), default_timeout_(default_timeout) {}

std::shared_ptr<IOptimizer> OptimizerBridge::Resolve(const OptimizerSettings& settings) {
	const std::string key = CacheKey(settings);
	absl::MutexLock lock(&mu_);
	auto it = cache_.find(key);
	if (it != cache_.end()) return it->second;
	std::shared_ptr<IOptimizer> optimizer = factory_ ? factory_(settings) : nullptr;
	if (optimizer) {
		cache_.emplace(key, optimizer);
	}
	return optimizer;
}

OptimizerInvocation OptimizerBridge::Invoke(const OptimizerSettings& settings,
		const wipflow::OptimizerRequest& request, SimMinute now) {
	OptimizerInvocation invocation;
	if (!settings.enabled()) {
		return invocation;
	}
	invocation.invoked = true;
	invocation.optimizer = settings.Identity();
	const std::string where = request.factory_id() + "/" + request.stage();

	std::shared_ptr<IOptimizer> optimizer = Resolve(settings);
	if (!optimizer) {
		invocation.failed = true;
		invocation.error = std::string("no optimizer available for kind ") + OptimizerKindName(settings.kind);
		LOG(WARNING) << "[OptimizerBridge] " << where << ": " << invocation.error << ", falling back to FIFO";
		return invocation;
	}

	const absl::Duration timeout = settings.timeout_ms > 0 ? absl::Milliseconds(settings.timeout_ms)
		: default_timeout_;
	const absl::Time start = absl::Now();
	absl::StatusOr<wipflow::OptimizerResponse> result = absl::UnknownError("optimizer did not run");
	try {
		result = optimizer->Optimize(request, timeout);
	} catch (const std::exception& e) {
		result = absl::InternalError(std::string("optimizer threw: ") + e.what());
	}
	invocation.duration_ms = absl::ToInt64Milliseconds(absl::Now() - start);

	if (!result.ok()) {
		invocation.failed = true;
		invocation.error = result.status().ToString();
		LOG(WARNING) << "[OptimizerBridge] " << optimizer->Name() << " failed for " << where << " after "
			<< invocation.duration_ms << "ms: " << invocation.error << ", falling back to FIFO";
		return invocation;
	}

	invocation.validation = ValidateOptimizerResponse(&*result, now);
	if (invocation.validation.total() > 0) {
		LOG(WARNING) << "[OptimizerBridge] " << optimizer->Name() << " output for " << where << ": dropped "
			<< invocation.validation.dropped_ids << " ids, " << invocation.validation.dropped_etas << " etas, "
			<< invocation.validation.dropped_holds << " hold decisions";
	}
	VLOG(2) << "\t[OptimizerBridge] " << optimizer->Name() << " answered for " << where << " in "
		<< invocation.duration_ms << "ms with " << result->release_list_size() << " ranked ids";
	invocation.response = std::move(*result);
	return invocation;
}

} // namespace Wipflow
