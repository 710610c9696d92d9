#include "scheduler/batch_window.h"

#include <glog/logging.h>

#include "common/fine_grained_lock.h"

namespace Wipflow {

BatchWindowController::BatchWindowController(IStageConfigRepository* configs) : configs_(configs) {
	CHECK(configs_ != nullptr) << "BatchWindowController needs a config repository";
}

absl::StatusOr<bool> BatchWindowController::OnEnqueue(const std::string& factory_id, Stage stage, SimMinute now) {
	return Open(factory_id, stage, now, "enqueue");
}

absl::StatusOr<bool> BatchWindowController::CarryOver(const std::string& factory_id, Stage stage, SimMinute now) {
	return Open(factory_id, stage, now, "carry-over");
}

absl::StatusOr<bool> BatchWindowController::Open(const std::string& factory_id, Stage stage, SimMinute now,
		const char* cause) {
	auto config = configs_->Get(factory_id);
	if (!config.ok()) return config.status();
	if (config->For(stage).release_after_minutes <= 0) {
		return false;
	}
	auto opened = configs_->OpenWindow(factory_id, stage, now);
	if (opened.ok() && *opened) {
		VLOG(1) << "\t[BatchWindow] " << StageLock::Key(factory_id, stage) << " window opened at " << now
			<< " by " << cause << ", due at " << now + config->For(stage).release_after_minutes;
	}
	return opened;
}

absl::StatusOr<WindowCheck> BatchWindowController::CheckDue(const std::string& factory_id, Stage stage,
		SimMinute now, bool has_pending) {
	auto config = configs_->Get(factory_id);
	if (!config.ok()) return config.status();
	const StageConfig& stage_config = config->For(stage);

	WindowCheck check;
	if (!has_pending) {
		if (stage_config.batch_start_sim_minute.has_value()) {
			absl::Status closed = configs_->CloseWindow(factory_id, stage);
			if (!closed.ok()) return closed;
			check.window_closed = true;
			VLOG(1) << "\t[BatchWindow] " << StageLock::Key(factory_id, stage) << " pending set empty, window closed";
		}
		check.message = "No orders in batch";
		return check;
	}

	if (stage_config.release_after_minutes == 0) {
		check.due = true;
		check.immediate = true;
		return check;
	}

	if (!stage_config.batch_start_sim_minute.has_value()) {
		check.message = "No active batch";
		return check;
	}

	const SimMinute due_at = *stage_config.batch_start_sim_minute + stage_config.release_after_minutes;
	if (now >= due_at) {
		check.due = true;
		return check;
	}
	check.waiting = true;
	check.wait_minutes = due_at - now;
	check.message = "Waiting for batch window";
	return check;
}

absl::Status BatchWindowController::MarkReleased(const std::string& factory_id, Stage stage) {
	{
		absl::MutexLock lock(&mu_);
		generations_[StageLock::Key(factory_id, stage)] = ++counter_;
	}
	return configs_->CloseWindow(factory_id, stage);
}

uint64_t BatchWindowController::Generation(const std::string& factory_id, Stage stage) const {
	absl::MutexLock lock(&mu_);
	auto it = generations_.find(StageLock::Key(factory_id, stage));
	return it == generations_.end() ? floor_ : it->second;
}

void BatchWindowController::Reset() {
	{
		absl::MutexLock lock(&mu_);
		generations_.clear();
		floor_ = ++counter_;
	}
	configs_->CloseAllWindows();
}

} // namespace Wipflow
