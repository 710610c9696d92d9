#include "queue/stage_config_repository.h"

#include <glog/logging.h>

namespace Wipflow {

const char* OptimizerKindName(OptimizerKind kind) {
	switch (kind) {
		case OptimizerKind::kNone: return "none";
		case OptimizerKind::kProcess: return "process";
		case OptimizerKind::kGrpc: return "grpc";
	}
	return "unknown";
}

std::optional<OptimizerKind> ParseOptimizerKind(const std::string& text) {
	if (text.empty() || text == "none") return OptimizerKind::kNone;
	if (text == "process") return OptimizerKind::kProcess;
	if (text == "grpc") return OptimizerKind::kGrpc;
	return std::nullopt;
}

std::string OptimizerSettings::Identity() const {
	if (!label.empty()) return label;
	switch (kind) {
		case OptimizerKind::kNone: return "fcfs";
		case OptimizerKind::kProcess: return command;
		case OptimizerKind::kGrpc: return "grpc://" + endpoint;
	}
	return "unknown";
}

InMemoryStageConfigRepository::InMemoryStageConfigRepository(
		const std::array<StageConfig, kNumStages>& defaults)
	: defaults_(defaults) {
	for (StageConfig& stage : defaults_) {
		stage.batch_start_sim_minute.reset();
	}
}

absl::Status InMemoryStageConfigRepository::RegisterFactory(const std::string& factory_id) {
	if (factory_id.empty()) {
		return absl::InvalidArgumentError("factory id must not be empty");
	}
	absl::MutexLock lock(&mu_);
	factories_.try_emplace(factory_id, std::nullopt);
	return absl::OkStatus();
}

bool InMemoryStageConfigRepository::HasFactory(const std::string& factory_id) const {
	absl::MutexLock lock(&mu_);
	return factories_.contains(factory_id);
}

absl::StatusOr<FactoryQueueConfig*> InMemoryStageConfigRepository::GetOrCreateLocked(
		const std::string& factory_id) {
	auto it = factories_.find(factory_id);
	if (it == factories_.end()) {
		return absl::NotFoundError("factory " + factory_id + " not found");
	}
	if (!it->second.has_value()) {
		FactoryQueueConfig config;
		config.factory_id = factory_id;
		config.stages = defaults_;
		it->second = std::move(config);
		VLOG(1) << "\t[StageConfig] created default queue config for factory " << factory_id;
	}
	return &*it->second;
}

absl::StatusOr<FactoryQueueConfig> InMemoryStageConfigRepository::Get(const std::string& factory_id) {
	absl::MutexLock lock(&mu_);
	auto config = GetOrCreateLocked(factory_id);
	if (!config.ok()) return config.status();
	return **config;
}

absl::StatusOr<FactoryQueueConfig> InMemoryStageConfigRepository::Update(const std::string& factory_id,
		const QueueConfigUpdate& update) {
	for (Stage stage : kAllStages) {
		const auto& stage_update = update.stages[StageIndex(stage)];
		if (stage_update && stage_update->release_after_minutes && *stage_update->release_after_minutes < 0) {
			return absl::InvalidArgumentError(std::string("release minutes for ") + StageCode(stage) +
					" must not be negative");
		}
	}

	absl::MutexLock lock(&mu_);
	auto config = GetOrCreateLocked(factory_id);
	if (!config.ok()) return config.status();
	for (Stage stage : kAllStages) {
		const auto& stage_update = update.stages[StageIndex(stage)];
		if (!stage_update) continue;
		StageConfig& target = (*config)->For(stage);
		if (stage_update->release_after_minutes) {
			// An open window is kept; with 0 minutes it is ignored until the next release clears it
			target.release_after_minutes = *stage_update->release_after_minutes;
		}
		if (stage_update->optimizer) {
			target.optimizer = *stage_update->optimizer;
		}
	}
	return **config;
}

absl::StatusOr<bool> InMemoryStageConfigRepository::OpenWindow(const std::string& factory_id,
		Stage stage, SimMinute now) {
	absl::MutexLock lock(&mu_);
	auto config = GetOrCreateLocked(factory_id);
	if (!config.ok()) return config.status();
	StageConfig& target = (*config)->For(stage);
	if (target.batch_start_sim_minute.has_value()) return false;
	target.batch_start_sim_minute = now;
	return true;
}

absl::Status InMemoryStageConfigRepository::CloseWindow(const std::string& factory_id, Stage stage) {
	absl::MutexLock lock(&mu_);
	auto config = GetOrCreateLocked(factory_id);
	if (!config.ok()) return config.status();
	(*config)->For(stage).batch_start_sim_minute.reset();
	return absl::OkStatus();
}

void InMemoryStageConfigRepository::CloseAllWindows() {
	absl::MutexLock lock(&mu_);
	for (auto& [factory_id, config] : factories_) {
		if (!config) continue;
		for (StageConfig& stage : config->stages) {
			stage.batch_start_sim_minute.reset();
		}
	}
}

} // namespace Wipflow
