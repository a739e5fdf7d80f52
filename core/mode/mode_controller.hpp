#pragma once

#include "interaction/interaction.hpp"
#include "interaction/interaction_engine.hpp"
#include "mode/budget_manager.hpp"

#include <optional>

namespace arbor {

enum class Mode : uint8_t {
    EXPLORATORY,
    RESOLVED
};

const char* modeName(Mode mode);

struct ModeConfig {
    double collapse_threshold = 1.0;  // weight at which a unit/group commits
    int max_iterations = 1000;        // interactions + steps before forced collapse
    double max_seconds = 30.0;        // wall-clock budget per context
};

/// A unit or group eligible for emission.
struct CollapseCandidate {
    EmitTarget target = EmitTarget::UNIT;
    uint64_t id = 0;
    double weight = 0.0;
    uint64_t sequence_index = 0;   // group: earliest member
};

// ─── Mode Controller ──────────────────────────────────────────
// EXPLORATORY → RESOLVED, once per context. Decides when to collapse
// and what to collapse onto; the context performs the Emit.

class ModeController {
public:
    explicit ModeController(ModeConfig config = {});

    /// Restart the budget (new context or fork).
    void start();

    Mode mode() const { return mode_; }
    bool resolved() const { return mode_ == Mode::RESOLVED; }
    const ModeConfig& config() const { return config_; }
    const BudgetManager& budget() const { return budget_; }

    void recordIteration() { budget_.recordIteration(); }
    bool budgetExhausted() const { return !budget_.canContinue(); }

    /// Best candidate if it has reached the collapse threshold.
    std::optional<CollapseCandidate> thresholdCandidate(
        const ContextState& state, const InteractionEngine& engine) const;

    /// Highest aggregate weight over units and groups, earliest
    /// sequence_index on ties. Throws NoSignalError when every weight
    /// is zero or there is nothing to choose from.
    CollapseCandidate selectCandidate(
        const ContextState& state, const InteractionEngine& engine) const;

    void markResolved(CollapseCause cause);
    std::optional<CollapseCause> cause() const { return cause_; }

private:
    ModeConfig config_;
    BudgetManager budget_;
    Mode mode_ = Mode::EXPLORATORY;
    std::optional<CollapseCause> cause_;

    std::optional<CollapseCandidate> best(
        const ContextState& state, const InteractionEngine& engine) const;
};

} // namespace arbor
