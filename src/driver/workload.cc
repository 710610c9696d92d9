#include "driver/workload.h"

#include <algorithm>
#include <optional>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Wipflow {

namespace {

std::optional<std::string> OptionalString(const YAML::Node& node, const char* key) {
	if (!node[key]) return std::nullopt;
	return node[key].as<std::string>();
}

absl::StatusOr<Workload> ParseWorkload(const YAML::Node& yaml) {
	if (!yaml["workload"]) {
		return absl::InvalidArgumentError("workload document has no top-level 'workload' section");
	}
	const YAML::Node root = yaml["workload"];
	Workload workload;

	if (root["factories"]) {
		for (const auto& factory : root["factories"]) {
			workload.factories.push_back(factory.as<std::string>());
		}
	}

	if (root["orders"]) {
		for (const auto& node : root["orders"]) {
			WorkloadOrder order;
			if (!node["id"] || !node["factory"]) {
				return absl::InvalidArgumentError("workload order needs id and factory");
			}
			order.info.order_id = node["id"].as<std::string>();
			order.info.factory_id = node["factory"].as<std::string>();
			order.arrival = node["arrival"] ? node["arrival"].as<SimMinute>() : 0;
			order.info.due_date = OptionalString(node, "due_date");
			order.info.created_at = OptionalString(node, "created_at");
			order.info.product_group = OptionalString(node, "product_group");
			order.info.product_variant = OptionalString(node, "product_variant");
			if (node["possible_sequence"]) order.info.possible_sequence = node["possible_sequence"].as<std::string>();
			if (node["process_times"]) order.info.process_times = node["process_times"].as<std::string>();

			if (std::find(workload.factories.begin(), workload.factories.end(), order.info.factory_id) ==
					workload.factories.end()) {
				workload.factories.push_back(order.info.factory_id);
			}
			workload.orders.push_back(std::move(order));
		}
	}

	if (root["holds"]) {
		for (const auto& node : root["holds"]) {
			ScriptedHold hold;
			std::optional<Stage> stage = ParseStage(node["stage"] ? node["stage"].as<std::string>() : "");
			if (!stage) {
				return absl::InvalidArgumentError("workload hold has an unknown stage");
			}
			hold.stage = *stage;
			hold.order_id = node["order"].as<std::string>();
			hold.at = node["at"].as<SimMinute>();
			hold.until = node["until"].as<SimMinute>();
			hold.reason = node["reason"] ? node["reason"].as<std::string>() : "scripted";
			workload.holds.push_back(std::move(hold));
		}
	}

	std::stable_sort(workload.orders.begin(), workload.orders.end(),
			[](const WorkloadOrder& a, const WorkloadOrder& b) { return a.arrival < b.arrival; });
	std::stable_sort(workload.holds.begin(), workload.holds.end(),
			[](const ScriptedHold& a, const ScriptedHold& b) { return a.at < b.at; });
	return workload;
}

} // namespace

absl::StatusOr<Workload> LoadWorkloadFromFile(const std::string& path) {
	try {
		return ParseWorkload(YAML::LoadFile(path));
	} catch (const YAML::Exception& e) {
		LOG(ERROR) << "Failed to parse workload file " << path << ": " << e.what();
		return absl::InvalidArgumentError(std::string("cannot parse workload: ") + e.what());
	}
}

absl::StatusOr<Workload> LoadWorkloadFromString(const std::string& yaml_content) {
	try {
		return ParseWorkload(YAML::Load(yaml_content));
	} catch (const YAML::Exception& e) {
		LOG(ERROR) << "Failed to parse workload: " << e.what();
		return absl::InvalidArgumentError(std::string("cannot parse workload: ") + e.what());
	}
}

} // namespace Wipflow
