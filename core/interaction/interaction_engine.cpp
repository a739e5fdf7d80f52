#include "interaction/interaction_engine.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace arbor {

// ─── ContextState ─────────────────────────────────────────────

UnitMap& ContextState::mutableUnits() {
    if (units_.use_count() > 1) {
        // Detach: copy first, then drop our reference to the shared map.
        units_ = std::make_shared<UnitMap>(*units_);
    }
    return *units_;
}

const InformationUnit* ContextState::findUnit(uint64_t id) const {
    auto it = units_->find(id);
    return it != units_->end() ? &it->second : nullptr;
}

ContextState ContextState::forkCopy() const {
    ContextState copy;
    copy.units_ = units_;
    copy.groups = groups;
    copy.next_group_id = next_group_id;
    return copy;
}

// ─── Validation ───────────────────────────────────────────────

namespace {

void requireUnit(const ContextState& state, uint64_t id) {
    if (!state.findUnit(id)) {
        throw UnknownUnitError("unknown unit id: " + std::to_string(id));
    }
}

} // namespace

void InteractionEngine::validate(const ContextState& state, const Interaction& op) const {
    if (auto* link = std::get_if<Link>(&op)) {
        if (link->unit_ids.empty()) {
            throw InvalidInteractionError("link requires at least one unit");
        }
        if (!(link->bond_strength > 0.0 && link->bond_strength <= 1.0)) {
            throw InvalidInteractionError("bond_strength must be in (0, 1]");
        }
        for (uint64_t id : link->unit_ids) requireUnit(state, id);
        if (link->group_id != 0 && !state.groups.count(link->group_id)) {
            throw UnknownGroupError("unknown group id: " + std::to_string(link->group_id));
        }
    } else if (auto* tr = std::get_if<Transform>(&op)) {
        requireUnit(state, tr->unit_id);
    } else if (auto* inv = std::get_if<Invalidate>(&op)) {
        if (inv->unit_ids.empty()) {
            throw InvalidInteractionError("invalidate requires at least one unit");
        }
        for (uint64_t id : inv->unit_ids) requireUnit(state, id);
    } else if (auto* w = std::get_if<Weight>(&op)) {
        requireUnit(state, w->unit_id);
        if (!(w->delta >= 0.0) || !std::isfinite(w->delta)) {
            throw InvalidInteractionError("weight delta must be finite and >= 0");
        }
    } else {
        const auto& emit = std::get<Emit>(op);
        if (emit.target == EmitTarget::UNIT) {
            requireUnit(state, emit.target_id);
        } else if (!state.groups.count(emit.target_id)) {
            throw UnknownGroupError("unknown group id: " + std::to_string(emit.target_id));
        }
    }
}

// ─── Apply ────────────────────────────────────────────────────

ContextDelta InteractionEngine::apply(ContextState& state, const Interaction& op) const {
    validate(state, op);

    ContextDelta delta;
    switch (op.index()) {
        case 0: delta = applyLink(state, std::get<Link>(op)); break;
        case 1: delta = applyTransform(state, std::get<Transform>(op)); break;
        case 2: delta = applyInvalidate(state, std::get<Invalidate>(op)); break;
        case 3: delta = applyWeight(state, std::get<Weight>(op)); break;
        default: delta = applyEmit(state, std::get<Emit>(op)); break;
    }

    LoggedInteraction entry;
    entry.seq = state.log.size() + 1;
    entry.at = nowMillis();
    entry.op = op;
    entry.delta = delta;
    state.log.push_back(std::move(entry));
    return delta;
}

ContextDelta InteractionEngine::applyLink(ContextState& state, const Link& op) const {
    ContextDelta delta;
    UnitGroup* group = nullptr;
    if (op.group_id == 0) {
        uint64_t gid = state.next_group_id++;
        UnitGroup g;
        g.id = gid;
        g.bond_strength = op.bond_strength;
        group = &state.groups.emplace(gid, std::move(g)).first->second;
    } else {
        group = &state.groups.at(op.group_id);
        group->bond_strength = op.bond_strength;
    }

    for (uint64_t id : op.unit_ids) {
        if (std::find(group->members.begin(), group->members.end(), id) ==
            group->members.end()) {
            group->members.push_back(id);
            delta.group_members_added.push_back(id);
        }
    }
    delta.group_id = group->id;
    return delta;
}

ContextDelta InteractionEngine::applyTransform(ContextState& state, const Transform& op) const {
    ContextDelta delta;
    InformationUnit& unit = state.mutableUnits().at(op.unit_id);

    delta.payload_changes.push_back({unit.id, unit.payload, op.payload});
    unit.payload = op.payload;

    if (op.state && *op.state != unit.state) {
        delta.state_changes.push_back({unit.id, unit.state, *op.state});
        unit.state = *op.state;
    }
    return delta;
}

ContextDelta InteractionEngine::applyInvalidate(ContextState& state, const Invalidate& op) const {
    ContextDelta delta;
    UnitMap& units = state.mutableUnits();
    std::unordered_set<uint64_t> seen;
    for (uint64_t id : op.unit_ids) {
        if (!seen.insert(id).second) continue;
        InformationUnit& unit = units.at(id);
        if (unit.state != UnitState::CONTESTED) {
            delta.state_changes.push_back({id, unit.state, UnitState::CONTESTED});
            unit.state = UnitState::CONTESTED;
        }
        double before = unit.weight;
        unit.weight = before * (1.0 - config_.invalidate_penalty);
        delta.weight_changes.push_back({id, before, unit.weight});
    }
    ARBOR_LOG_DEBUG("engine", "invalidated %zu units (%s)", seen.size(), op.reason.c_str());
    return delta;
}

ContextDelta InteractionEngine::applyWeight(ContextState& state, const Weight& op) const {
    ContextDelta delta;
    InformationUnit& unit = state.mutableUnits().at(op.unit_id);
    double before = unit.weight;
    unit.weight = before + op.delta;
    delta.weight_changes.push_back({unit.id, before, unit.weight});
    return delta;
}

ContextDelta InteractionEngine::applyEmit(ContextState& /*state*/, const Emit& /*op*/) const {
    ContextDelta delta;
    delta.emitted = true;
    return delta;
}

// ─── Queries ──────────────────────────────────────────────────

double InteractionEngine::groupWeight(const ContextState& state, const UnitGroup& group) const {
    double total = 0.0;
    for (uint64_t id : group.members) {
        const InformationUnit* u = state.findUnit(id);
        if (!u) continue;
        if (config_.aggregation == Aggregation::SUM) {
            total += u->weight;
        } else {
            total = std::max(total, u->weight);
        }
    }
    return total;
}

// Opposing declared states only contradict when both units carry the same
// (kind, value). Different values of one kind may legitimately disagree.
std::vector<std::pair<uint64_t, uint64_t>> InteractionEngine::findContradictions(
    const ContextState& state) const {
    std::vector<std::pair<uint64_t, uint64_t>> pairs;
    std::vector<const InformationUnit*> declared;
    for (const auto& [id, unit] : state.units()) {
        if (unit.state == UnitState::POS || unit.state == UnitState::NEG) {
            declared.push_back(&unit);
        }
    }
    for (size_t i = 0; i < declared.size(); i++) {
        for (size_t j = i + 1; j < declared.size(); j++) {
            const InformationUnit* a = declared[i];
            const InformationUnit* b = declared[j];
            if (a->state != b->state && a->kind() == b->kind() && a->value() == b->value()) {
                pairs.emplace_back(a->id, b->id);
            }
        }
    }
    return pairs;
}

} // namespace arbor
