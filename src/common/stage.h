#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Wipflow {

/// All due-time arithmetic is in simulation minutes.
using SimMinute = int64_t;

/**
 * The three sequential scheduling stages of the reassembly flow.
 */
enum class Stage : int {
	kPreAcceptance = 0,   // PAP
	kPreInspection = 1,   // PIP
	kPostInspection = 2,  // PIPO
};

inline constexpr size_t kNumStages = 3;

inline constexpr std::array<Stage, kNumStages> kAllStages = {
	Stage::kPreAcceptance, Stage::kPreInspection, Stage::kPostInspection};

inline size_t StageIndex(Stage stage) {
	return static_cast<size_t>(stage);
}

/// Queue name ("preAcceptance", "preInspection", "postInspection")
inline const char* StageName(Stage stage) {
	switch (stage) {
		case Stage::kPreAcceptance: return "preAcceptance";
		case Stage::kPreInspection: return "preInspection";
		case Stage::kPostInspection: return "postInspection";
	}
	return "unknown";
}

/// Scheduling stage code ("PAP", "PIP", "PIPO")
inline const char* StageCode(Stage stage) {
	switch (stage) {
		case Stage::kPreAcceptance: return "PAP";
		case Stage::kPreInspection: return "PIP";
		case Stage::kPostInspection: return "PIPO";
	}
	return "UNKNOWN";
}

/// Accepts either the queue name or the stage code, case-sensitive.
inline std::optional<Stage> ParseStage(std::string_view text) {
	for (Stage stage : kAllStages) {
		if (text == StageName(stage) || text == StageCode(stage)) {
			return stage;
		}
	}
	if (text == "pap") return Stage::kPreAcceptance;
	if (text == "pip") return Stage::kPreInspection;
	if (text == "pipo") return Stage::kPostInspection;
	return std::nullopt;
}

/// Next stage downstream, nullopt after PIPO.
inline std::optional<Stage> NextStage(Stage stage) {
	switch (stage) {
		case Stage::kPreAcceptance: return Stage::kPreInspection;
		case Stage::kPreInspection: return Stage::kPostInspection;
		case Stage::kPostInspection: return std::nullopt;
	}
	return std::nullopt;
}

} // namespace Wipflow
