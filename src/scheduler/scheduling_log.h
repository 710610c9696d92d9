#pragma once

#include <atomic>
#include <fstream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "folly/MPMCQueue.h"

#include <scheduling_log.pb.h>

#include "common/stage.h"

namespace Wipflow {

// Scheduling log modes
inline constexpr char kModeIntegrated[] = "INTEGRATED";   // optimizer run
inline constexpr char kModeFcfs[] = "FCFS";               // cycle without optimizer
inline constexpr char kModeSummary[] = "SUMMARY";         // post-release record

/**
 * Append-only record of scheduling runs, tailed by observability consumers.
 */
class ISchedulingLog {
public:
	virtual ~ISchedulingLog() = default;
	virtual absl::Status Append(const wipflow::SchedulingLogEntry& entry) = 0;
};

// Appends and only warns on failure; a log problem never fails a cycle.
void LogBestEffort(ISchedulingLog* log, const wipflow::SchedulingLogEntry& entry);

wipflow::SchedulingLogEntry NewLogEntry(const std::string& factory_id, Stage stage,
		const std::string& mode, SimMinute sim_minute);

class InMemorySchedulingLog : public ISchedulingLog {
public:
	absl::Status Append(const wipflow::SchedulingLogEntry& entry) override;

	std::vector<wipflow::SchedulingLogEntry> Entries() const;
	std::vector<wipflow::SchedulingLogEntry> EntriesFor(const std::string& factory_id, Stage stage) const;
	size_t size() const;
	void Clear();

private:
	mutable absl::Mutex mu_;
	std::vector<wipflow::SchedulingLogEntry> entries_ ABSL_GUARDED_BY(mu_);
};

/**
 * Writes entries as JSON lines from a background thread. Append never blocks:
 * when the queue is full the entry is dropped and an error is returned.
 */
class JsonlSchedulingLog : public ISchedulingLog {
public:
	JsonlSchedulingLog(const std::string& path, size_t queue_capacity);
	~JsonlSchedulingLog() override;

	bool IsOpen() const { return open_; }
	absl::Status Append(const wipflow::SchedulingLogEntry& entry) override;

	// Blocks until every accepted entry is on disk.
	void Flush();

	size_t written() const { return written_.load(std::memory_order_acquire); }
	size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
	void WriterThread();

	std::string path_;
	std::ofstream out_;
	bool open_ = false;
	folly::MPMCQueue<std::optional<wipflow::SchedulingLogEntry>> queue_;
	std::thread writer_;
	std::atomic<size_t> accepted_{0};
	std::atomic<size_t> written_{0};
	std::atomic<size_t> dropped_{0};
};

} // namespace Wipflow
