#pragma once

#include "importance/importance.hpp"
#include "interaction/interaction.hpp"
#include "interaction/interaction_engine.hpp"
#include "mode/mode_controller.hpp"
#include "unit/information_unit.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

/// Per-context tuning. Copied into every context a manager creates.
struct ContextConfig {
    ModeConfig mode;
    InteractionConfig interaction;
    ImportanceConfig importance;
    std::shared_ptr<const ImportanceStrategy> importance_strategy;  // null = ClippedWeightedSum
};

// ─── Processing Context ───────────────────────────────────────
// An isolated, forkable unit of work: private units, groups and
// interaction log, plus the mode controller that decides when the
// context commits. One thread at a time; no internal locking.

class ProcessingContext {
    struct ForkTag {};

public:
    ProcessingContext(uint64_t id, ContextConfig config,
                      std::optional<uint64_t> parent_id = std::nullopt);

    /// Fork constructor; ForkTag keeps it reachable only through fork().
    ProcessingContext(const ForkTag&, const ProcessingContext& parent, uint64_t new_id);

    ProcessingContext(const ProcessingContext&) = delete;
    ProcessingContext& operator=(const ProcessingContext&) = delete;

    // ── Identity and state ──
    uint64_t id() const { return id_; }
    std::optional<uint64_t> parentId() const { return parent_id_; }
    Mode mode() const { return mode_.mode(); }
    bool resolved() const { return mode_.resolved(); }
    bool cancelled() const { return cancelled_; }
    double collapseThreshold() const { return config_.mode.collapse_threshold; }
    const ModeController& modeController() const { return mode_; }
    const InteractionEngine& engine() const { return engine_; }

    // ── Read access ──
    const UnitMap& units() const { return state_.units(); }
    const std::map<uint64_t, UnitGroup>& groups() const { return state_.groups; }
    const InteractionLog& log() const { return state_.log; }
    const InformationUnit* findUnit(uint64_t id) const { return state_.findUnit(id); }
    double groupWeight(uint64_t group_id) const;

    /// Earliest unit (by sequence_index) carrying the identity, or 0.
    uint64_t representativeOf(const std::string& identity_key) const;

    // ── Mutation ──

    /// Take ownership of units. Ids and sequence indices are re-keyed to
    /// continue this context's numbering. Returns the new ids in order.
    std::vector<uint64_t> ingest(const std::vector<InformationUnit>& units);

    /// One observation of a unit: counts its identity in the repetition
    /// window and records the assigned Δweight as a Weight interaction on
    /// the identity's representative.
    ContextDelta observe(uint64_t unit_id, const Signal& cues = {});

    /// ingest() then observe() every new unit in order, with the position
    /// cue set from its place in the batch.
    std::vector<uint64_t> ingestAndObserve(const std::vector<InformationUnit>& units,
                                           const Signal& cues = {});

    /// Apply and log one interaction, then run the collapse check.
    ContextDelta apply(const Interaction& op);

    /// Undo a logged Transform by appending its inverse.
    ContextDelta revert(uint64_t seq);

    /// Exploratory iteration without an interaction (timer path).
    void step();

    /// Force resolution onto the current best candidate. Returns the
    /// existing result if already resolved.
    const EmitRecord& resolve();

    /// Fold a resolved child's emitted units into this context as
    /// logged MERGE weights. Units unknown here are created first.
    void adopt(const EmitRecord& child_result);

    /// Discard units and log. Every later call raises ContextCancelledError.
    void cancel();

    const std::optional<EmitRecord>& result() const { return result_; }

    /// Copy-on-write fork with an independent log and a fresh budget.
    std::unique_ptr<ProcessingContext> fork(uint64_t new_id) const;

private:

    uint64_t id_;
    std::optional<uint64_t> parent_id_;
    ContextConfig config_;
    InteractionEngine engine_;
    ImportanceAssigner importance_;
    ModeController mode_;
    ContextState state_;
    RepetitionWindow window_;
    uint64_t next_unit_id_ = 1;
    uint64_t next_sequence_ = 0;
    std::optional<EmitRecord> result_;
    bool cancelled_ = false;

    void ensureWritable() const;
    ContextDelta applyLogged(const Interaction& op);
    void invalidateContradictions(uint64_t unit_id);
    void checkCollapse();
    void collapse(CollapseCause cause);
    void commit(EmitTarget target, uint64_t target_id, double weight, CollapseCause cause);
};

} // namespace arbor
