#pragma once

#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "queue/stage_config_repository.h"

namespace Wipflow {

struct WindowCheck {
	bool due = false;
	bool waiting = false;
	bool immediate = false;       // release_after_minutes == 0
	bool window_closed = false;   // closed by this check (empty pending set)
	SimMinute wait_minutes = 0;
	std::string message;
};

/**
 * Decides when a (factory, stage) is due to release.
 *
 * Window: Closed -> Open(batch_start) -> Closed. It opens on the first enqueue
 * with release_after_minutes > 0 and closes on a successful release or when
 * a check finds the pending set empty. Entries left pending by a release
 * (held ones) start a fresh window at the release minute. Each close by release bumps a
 * generation so a cycle that ran its optimizer unlocked can tell whether its
 * window was released under it.
 */
class BatchWindowController {
public:
	explicit BatchWindowController(IStageConfigRepository* configs);

	// Returns true if this enqueue opened the window.
	absl::StatusOr<bool> OnEnqueue(const std::string& factory_id, Stage stage, SimMinute now);

	absl::StatusOr<WindowCheck> CheckDue(const std::string& factory_id, Stage stage,
			SimMinute now, bool has_pending);

	// Closes the window after a successful release and bumps the generation.
	absl::Status MarkReleased(const std::string& factory_id, Stage stage);

	// Opens a fresh window for entries a release left pending. Returns true if opened.
	absl::StatusOr<bool> CarryOver(const std::string& factory_id, Stage stage, SimMinute now);

	uint64_t Generation(const std::string& factory_id, Stage stage) const;

	// Closes every window and invalidates every in-flight cycle.
	void Reset();

private:
	absl::StatusOr<bool> Open(const std::string& factory_id, Stage stage, SimMinute now, const char* cause);

	IStageConfigRepository* configs_;

	mutable absl::Mutex mu_;
	absl::flat_hash_map<std::string, uint64_t> generations_ ABSL_GUARDED_BY(mu_);
	uint64_t counter_ ABSL_GUARDED_BY(mu_) = 0;
	uint64_t floor_ ABSL_GUARDED_BY(mu_) = 0;
};

} // namespace Wipflow
