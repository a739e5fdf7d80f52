#include "mode/mode_controller.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <limits>

namespace arbor {

const char* modeName(Mode mode) {
    return mode == Mode::EXPLORATORY ? "EXPLORATORY" : "RESOLVED";
}

ModeController::ModeController(ModeConfig config)
    : config_(config), budget_(config.max_seconds, config.max_iterations) {
    budget_.start();
}

void ModeController::start() {
    budget_.start();
    mode_ = Mode::EXPLORATORY;
    cause_.reset();
}

std::optional<CollapseCandidate> ModeController::best(
    const ContextState& state, const InteractionEngine& engine) const {
    std::optional<CollapseCandidate> top;

    auto consider = [&](const CollapseCandidate& c) {
        if (!top || c.weight > top->weight ||
            (c.weight == top->weight && c.sequence_index < top->sequence_index)) {
            top = c;
        }
    };

    for (const auto& [id, unit] : state.units()) {
        consider({EmitTarget::UNIT, id, unit.weight, unit.sequence_index});
    }
    for (const auto& [gid, group] : state.groups) {
        uint64_t earliest = std::numeric_limits<uint64_t>::max();
        for (uint64_t uid : group.members) {
            if (const InformationUnit* u = state.findUnit(uid)) {
                earliest = std::min(earliest, u->sequence_index);
            }
        }
        // A group tied with its own earliest member loses to the unit,
        // which was seen first in the loop above.
        consider({EmitTarget::GROUP, gid, engine.groupWeight(state, group), earliest});
    }
    return top;
}

std::optional<CollapseCandidate> ModeController::thresholdCandidate(
    const ContextState& state, const InteractionEngine& engine) const {
    auto top = best(state, engine);
    if (top && top->weight >= config_.collapse_threshold) return top;
    return std::nullopt;
}

CollapseCandidate ModeController::selectCandidate(
    const ContextState& state, const InteractionEngine& engine) const {
    auto top = best(state, engine);
    if (!top || top->weight <= 0.0) {
        throw NoSignalError("no unit or group carries any weight");
    }
    return *top;
}

void ModeController::markResolved(CollapseCause cause) {
    mode_ = Mode::RESOLVED;
    cause_ = cause;
}

} // namespace arbor
