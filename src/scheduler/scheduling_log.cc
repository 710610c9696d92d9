#include "scheduler/scheduling_log.h"

#include <chrono>

#include <glog/logging.h>
#include <google/protobuf/util/json_util.h>

#include "absl/time/clock.h"

namespace Wipflow {

void LogBestEffort(ISchedulingLog* log, const wipflow::SchedulingLogEntry& entry) {
	if (log == nullptr) return;
	absl::Status status = log->Append(entry);
	if (!status.ok()) {
		LOG(WARNING) << "[SchedulingLog] append for " << entry.factory_id() << "/" << entry.stage()
			<< " (" << entry.mode() << ") failed: " << status;
	}
}

wipflow::SchedulingLogEntry NewLogEntry(const std::string& factory_id, Stage stage,
		const std::string& mode, SimMinute sim_minute) {
	wipflow::SchedulingLogEntry entry;
	entry.set_factory_id(factory_id);
	entry.set_stage(StageCode(stage));
	entry.set_mode(mode);
	entry.set_sim_minute(sim_minute);
	entry.set_timestamp_ms(absl::ToUnixMillis(absl::Now()));
	return entry;
}

absl::Status InMemorySchedulingLog::Append(const wipflow::SchedulingLogEntry& entry) {
	absl::MutexLock lock(&mu_);
	entries_.push_back(entry);
	return absl::OkStatus();
}

std::vector<wipflow::SchedulingLogEntry> InMemorySchedulingLog::Entries() const {
	absl::MutexLock lock(&mu_);
	return entries_;
}

std::vector<wipflow::SchedulingLogEntry> InMemorySchedulingLog::EntriesFor(const std::string& factory_id,
		Stage stage) const {
	absl::MutexLock lock(&mu_);
	std::vector<wipflow::SchedulingLogEntry> result;
	for (const auto& entry : entries_) {
		if (entry.factory_id() == factory_id && entry.stage() == StageCode(stage)) {
			result.push_back(entry);
		}
	}
	return result;
}

size_t InMemorySchedulingLog::size() const {
	absl::MutexLock lock(&mu_);
	return entries_.size();
}

void InMemorySchedulingLog::Clear() {
	absl::MutexLock lock(&mu_);
	entries_.clear();
}

JsonlSchedulingLog::JsonlSchedulingLog(const std::string& path, size_t queue_capacity)
	: path_(path), out_(path, std::ios::app), queue_(queue_capacity) {
	open_ = out_.is_open();
	if (!open_) {
		LOG(ERROR) << "[SchedulingLog] cannot open " << path_ << ", entries will be dropped";
	}
	writer_ = std::thread([this]() { this->WriterThread(); });
	VLOG(1) << "\t[SchedulingLog] writing to " << path_ << " (queue " << queue_capacity << ")";
}

JsonlSchedulingLog::~JsonlSchedulingLog() {
	// Sentinel wakes and stops the writer after it drains what is queued
	std::optional<wipflow::SchedulingLogEntry> sentinel = std::nullopt;
	queue_.blockingWrite(sentinel);
	if (writer_.joinable()) {
		writer_.join();
	}
	if (dropped() > 0) {
		LOG(WARNING) << "[SchedulingLog] " << dropped() << " entries dropped for " << path_;
	}
}

absl::Status JsonlSchedulingLog::Append(const wipflow::SchedulingLogEntry& entry) {
	if (!open_) {
		dropped_.fetch_add(1, std::memory_order_relaxed);
		return absl::UnavailableError("scheduling log file " + path_ + " is not open");
	}
	std::optional<wipflow::SchedulingLogEntry> item = entry;
	if (!queue_.write(std::move(item))) {
		dropped_.fetch_add(1, std::memory_order_relaxed);
		return absl::ResourceExhaustedError("scheduling log queue is full");
	}
	accepted_.fetch_add(1, std::memory_order_acq_rel);
	return absl::OkStatus();
}

void JsonlSchedulingLog::Flush() {
	while (written_.load(std::memory_order_acquire) < accepted_.load(std::memory_order_acquire)) {
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
	}
}

void JsonlSchedulingLog::WriterThread() {
	google::protobuf::util::JsonPrintOptions options;
	options.add_whitespace = false;
	std::optional<wipflow::SchedulingLogEntry> item;

	while (true) {
		queue_.blockingRead(item);
		if (!item.has_value()) {
			break;
		}
		std::string line;
		auto status = google::protobuf::util::MessageToJsonString(*item, &line, options);
		if (status.ok()) {
			out_ << line << '\n';
			out_.flush();
		} else {
			LOG(WARNING) << "[SchedulingLog] cannot serialize entry: " << status.ToString();
		}
		written_.fetch_add(1, std::memory_order_acq_rel);
	}
}

} // namespace Wipflow
