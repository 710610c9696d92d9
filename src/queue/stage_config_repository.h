#pragma once

#include <array>
#include <optional>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "common/stage.h"

namespace Wipflow {

enum class OptimizerKind {
	kNone,
	kProcess,   // external command, JSON over stdin/stdout
	kGrpc,      // remote wipflow.Optimizer service
};

const char* OptimizerKindName(OptimizerKind kind);
std::optional<OptimizerKind> ParseOptimizerKind(const std::string& text);

struct OptimizerSettings {
	OptimizerKind kind = OptimizerKind::kNone;
	std::string command;
	std::string endpoint;
	int64_t timeout_ms = 0;   // 0 keeps the scheduler-wide timeout
	std::string label;        // optimizer identity written with ETAs; defaults to command/endpoint

	bool enabled() const { return kind != OptimizerKind::kNone; }
	std::string Identity() const;
};

struct StageConfig {
	int release_after_minutes = 0;   // 0 = immediate, no batching
	std::optional<SimMinute> batch_start_sim_minute;
	OptimizerSettings optimizer;
};

struct FactoryQueueConfig {
	std::string factory_id;
	std::array<StageConfig, kNumStages> stages;

	const StageConfig& For(Stage stage) const { return stages[StageIndex(stage)]; }
	StageConfig& For(Stage stage) { return stages[StageIndex(stage)]; }
};

struct StageConfigUpdate {
	std::optional<int> release_after_minutes;
	std::optional<OptimizerSettings> optimizer;
};

struct QueueConfigUpdate {
	std::array<std::optional<StageConfigUpdate>, kNumStages> stages;

	QueueConfigUpdate& Set(Stage stage, StageConfigUpdate update) {
		stages[StageIndex(stage)] = std::move(update);
		return *this;
	}
};

/**
 * Per-factory scoped stage configuration and batch window markers.
 * Also the registry of known factories.
 */
class IStageConfigRepository {
public:
	virtual ~IStageConfigRepository() = default;

	virtual absl::Status RegisterFactory(const std::string& factory_id) = 0;
	virtual bool HasFactory(const std::string& factory_id) const = 0;

	// Creates the default config on first access for a registered factory.
	virtual absl::StatusOr<FactoryQueueConfig> Get(const std::string& factory_id) = 0;
	virtual absl::StatusOr<FactoryQueueConfig> Update(const std::string& factory_id,
			const QueueConfigUpdate& update) = 0;

	// Sets batch_start only if no window is open. Returns true if it opened one.
	virtual absl::StatusOr<bool> OpenWindow(const std::string& factory_id, Stage stage, SimMinute now) = 0;
	virtual absl::Status CloseWindow(const std::string& factory_id, Stage stage) = 0;
	virtual void CloseAllWindows() = 0;
};

class InMemoryStageConfigRepository : public IStageConfigRepository {
public:
	InMemoryStageConfigRepository() = default;
	// defaults are copied into each factory's config on first access
	explicit InMemoryStageConfigRepository(const std::array<StageConfig, kNumStages>& defaults);

	absl::Status RegisterFactory(const std::string& factory_id) override;
	bool HasFactory(const std::string& factory_id) const override;
	absl::StatusOr<FactoryQueueConfig> Get(const std::string& factory_id) override;
	absl::StatusOr<FactoryQueueConfig> Update(const std::string& factory_id,
			const QueueConfigUpdate& update) override;
	absl::StatusOr<bool> OpenWindow(const std::string& factory_id, Stage stage, SimMinute now) override;
	absl::Status CloseWindow(const std::string& factory_id, Stage stage) override;
	void CloseAllWindows() override;

private:
	absl::StatusOr<FactoryQueueConfig*> GetOrCreateLocked(const std::string& factory_id)
		ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

	std::array<StageConfig, kNumStages> defaults_;

	mutable absl::Mutex mu_;
	// nullopt until the config is first read or written
	absl::flat_hash_map<std::string, std::optional<FactoryQueueConfig>> factories_ ABSL_GUARDED_BY(mu_);
};

} // namespace Wipflow
