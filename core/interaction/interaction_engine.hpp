#pragma once

#include "interaction/interaction.hpp"
#include "unit/information_unit.hpp"

#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace arbor {

enum class Aggregation : uint8_t {
    SUM,
    MAX
};

struct InteractionConfig {
    Aggregation aggregation = Aggregation::SUM;  // group weight = sum or max of members
    double invalidate_penalty = 0.2;             // fraction removed by Invalidate
};

// ─── Context State ────────────────────────────────────────────
// Everything an interaction may touch. The unit map is shared
// copy-on-write between a context and its forks: readers use
// units(), writers go through mutableUnits(), which detaches first.

class ContextState {
public:
    ContextState() : units_(std::make_shared<UnitMap>()) {}

    const UnitMap& units() const { return *units_; }
    UnitMap& mutableUnits();

    const InformationUnit* findUnit(uint64_t id) const;

    std::map<uint64_t, UnitGroup> groups;
    InteractionLog log;
    uint64_t next_group_id = 1;

    /// Copy for a fork: shares the unit map, copies groups, fresh log.
    ContextState forkCopy() const;

    /// True while the unit map is shared with another context.
    bool sharesUnits() const { return units_.use_count() > 1; }

private:
    std::shared_ptr<UnitMap> units_;
};

// ─── Interaction Engine ───────────────────────────────────────
// Validates and applies interactions against one ContextState.
// A rejected interaction (unknown id, bad argument) changes nothing
// and is not logged.

class InteractionEngine {
public:
    explicit InteractionEngine(InteractionConfig config = {})
        : config_(config) {}

    /// Apply and log. Throws UnknownUnitError, UnknownGroupError or
    /// InvalidInteractionError without touching the state.
    ContextDelta apply(ContextState& state, const Interaction& op) const;

    /// Aggregate weight of a group under the configured aggregation.
    double groupWeight(const ContextState& state, const UnitGroup& group) const;

    /// Pairs of units with the same kind and value whose declared states
    /// oppose each other (POS vs NEG). Each pair is listed once.
    std::vector<std::pair<uint64_t, uint64_t>> findContradictions(
        const ContextState& state) const;

    const InteractionConfig& config() const { return config_; }

private:
    InteractionConfig config_;

    void validate(const ContextState& state, const Interaction& op) const;

    ContextDelta applyLink(ContextState& state, const Link& op) const;
    ContextDelta applyTransform(ContextState& state, const Transform& op) const;
    ContextDelta applyInvalidate(ContextState& state, const Invalidate& op) const;
    ContextDelta applyWeight(ContextState& state, const Weight& op) const;
    ContextDelta applyEmit(ContextState& state, const Emit& op) const;
};

} // namespace arbor
