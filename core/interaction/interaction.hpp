#pragma once

#include "common/clock.hpp"
#include "unit/information_unit.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace arbor {

// ─── Interaction Types ────────────────────────────────────────
// The only way a unit changes after creation. Every applied
// interaction is logged with the delta it produced.

enum class WeightReason : uint8_t {
    REPETITION,   // identity seen again in the repetition window
    RELEVANCE,    // first observation: keyword/urgency/position cues
    MANUAL,       // caller-issued
    MERGE,        // adopted from a resolved child context
    AGREEMENT     // observer agreement on a COMBINED unit
};

enum class EmitTarget : uint8_t {
    UNIT,
    GROUP
};

const char* weightReasonName(WeightReason reason);
const char* emitTargetName(EmitTarget target);

/// Create (group_id == 0) or extend a group.
struct Link {
    std::vector<uint64_t> unit_ids;
    double bond_strength = 1.0;   // (0, 1]
    uint64_t group_id = 0;
};

/// Replace the payload (value and kind), optionally declaring a state.
/// Id and weight are preserved.
struct Transform {
    uint64_t unit_id = 0;
    UnitPayload payload;
    std::optional<UnitState> state;
};

/// Mark units CONTESTED and apply the fixed penalty to each.
struct Invalidate {
    std::vector<uint64_t> unit_ids;
    std::string reason;
};

/// Add a non-negative weight delta.
struct Weight {
    uint64_t unit_id = 0;
    double delta = 0.0;
    WeightReason reason = WeightReason::MANUAL;
};

/// Commit a unit or group as the context's output.
struct Emit {
    EmitTarget target = EmitTarget::UNIT;
    uint64_t target_id = 0;
};

using Interaction = std::variant<Link, Transform, Invalidate, Weight, Emit>;

/// Short name of the active alternative ("link", "transform", ...).
const char* interactionName(const Interaction& op);

// ─── Context Delta ────────────────────────────────────────────
// What one interaction changed. Payload/state "before" values are
// the undo record for Transform.

struct WeightChange {
    uint64_t unit_id = 0;
    double before = 0.0;
    double after = 0.0;
};

struct StateChange {
    uint64_t unit_id = 0;
    UnitState before = UnitState::UNRESOLVED;
    UnitState after = UnitState::UNRESOLVED;
};

struct PayloadChange {
    uint64_t unit_id = 0;
    UnitPayload before;
    UnitPayload after;
};

struct ContextDelta {
    std::vector<WeightChange> weight_changes;
    std::vector<StateChange> state_changes;
    std::vector<PayloadChange> payload_changes;
    uint64_t group_id = 0;                      // group created/extended by Link
    std::vector<uint64_t> group_members_added;
    bool emitted = false;

    bool empty() const {
        return weight_changes.empty() && state_changes.empty() &&
               payload_changes.empty() && group_members_added.empty() && !emitted;
    }
};

struct LoggedInteraction {
    uint64_t seq = 0;          // 1-based position in the log
    Timestamp at = 0;
    Interaction op;
    ContextDelta delta;
};

/// Append-only; contexts expose it as a const reference.
using InteractionLog = std::vector<LoggedInteraction>;

// ─── Groups ───────────────────────────────────────────────────

struct UnitGroup {
    uint64_t id = 0;
    std::vector<uint64_t> members;   // insertion order, no duplicates
    double bond_strength = 1.0;
};

// ─── Emit Record ──────────────────────────────────────────────

enum class CollapseCause : uint8_t {
    THRESHOLD,   // a unit/group reached collapse_threshold
    FORCED,      // caller forced resolution
    BUDGET       // iteration/time budget exhausted
};

const char* collapseCauseName(CollapseCause cause);

/// A context's committed output.
struct EmitRecord {
    uint64_t context_id = 0;
    EmitTarget target = EmitTarget::UNIT;
    uint64_t target_id = 0;
    std::vector<uint64_t> unit_ids;          // the unit, or the group's members
    std::vector<InformationUnit> units;      // snapshots at emit time
    double weight = 0.0;                     // aggregate weight at emit time
    CollapseCause cause = CollapseCause::FORCED;

    /// Highest-weight emitted unit, earliest on ties.
    const InformationUnit& representative() const;
};

} // namespace arbor
