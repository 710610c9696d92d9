#ifndef WIPFLOW_SIM_CLOCK_H_
#define WIPFLOW_SIM_CLOCK_H_

#include <atomic>
#include <optional>

#include "absl/time/time.h"
#include "common/stage.h"

namespace Wipflow {

/**
 * Logical simulation clock advanced by the caller.
 *
 * Nothing in the scheduling core reads wall-clock time for due-time decisions.
 * The optional epoch only maps a sim minute to a calendar date when an ETA is
 * persisted downstream.
 */
class SimClock {
public:
	explicit SimClock(SimMinute start = 0) : now_(start) {}

	SimMinute Now() const { return now_.load(std::memory_order_acquire); }

	void Advance(SimMinute minutes) {
		now_.fetch_add(minutes, std::memory_order_acq_rel);
	}

	void Set(SimMinute minute) { now_.store(minute, std::memory_order_release); }

	void SetEpoch(absl::Time epoch) { epoch_ = epoch; }
	bool HasEpoch() const { return epoch_.has_value(); }

	// Fractional minutes are kept (ETAs are not integral).
	std::optional<absl::Time> ToCalendar(double sim_minute) const {
		if (!epoch_) return std::nullopt;
		return *epoch_ + absl::Seconds(sim_minute * 60.0);
	}

private:
	std::atomic<SimMinute> now_;
	std::optional<absl::Time> epoch_;
};

} // namespace Wipflow

#endif // WIPFLOW_SIM_CLOCK_H_
