#include "pipeline/processing_context.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <limits>

namespace arbor {

ProcessingContext::ProcessingContext(uint64_t id, ContextConfig config,
                                     std::optional<uint64_t> parent_id)
    : id_(id),
      parent_id_(parent_id),
      config_(std::move(config)),
      engine_(config_.interaction),
      importance_(config_.importance_strategy
                      ? ImportanceAssigner(config_.importance, config_.importance_strategy)
                      : ImportanceAssigner(config_.importance)),
      mode_(config_.mode),
      window_(config_.importance.window_size) {}

ProcessingContext::ProcessingContext(const ForkTag&, const ProcessingContext& parent,
                                     uint64_t new_id)
    : id_(new_id),
      parent_id_(parent.id_),
      config_(parent.config_),
      engine_(parent.engine_),
      importance_(parent.importance_),
      mode_(parent.config_.mode),
      state_(parent.state_.forkCopy()),
      window_(parent.window_),
      next_unit_id_(parent.next_unit_id_),
      next_sequence_(parent.next_sequence_) {}

// ─── Queries ──────────────────────────────────────────────────

double ProcessingContext::groupWeight(uint64_t group_id) const {
    auto it = state_.groups.find(group_id);
    if (it == state_.groups.end()) {
        throw UnknownGroupError("unknown group id: " + std::to_string(group_id));
    }
    return engine_.groupWeight(state_, it->second);
}

uint64_t ProcessingContext::representativeOf(const std::string& identity_key) const {
    uint64_t best_id = 0;
    uint64_t best_seq = std::numeric_limits<uint64_t>::max();
    for (const auto& [id, unit] : state_.units()) {
        if (unit.sequence_index < best_seq && unit.identityKey() == identity_key) {
            best_id = id;
            best_seq = unit.sequence_index;
        }
    }
    return best_id;
}

// ─── Mutation ─────────────────────────────────────────────────

void ProcessingContext::ensureWritable() const {
    if (cancelled_) {
        throw ContextCancelledError("context " + std::to_string(id_) + " was cancelled");
    }
    if (mode_.resolved()) {
        throw ContextFrozenError("context " + std::to_string(id_) + " is resolved");
    }
}

std::vector<uint64_t> ProcessingContext::ingest(const std::vector<InformationUnit>& units) {
    ensureWritable();
    std::vector<uint64_t> ids;
    ids.reserve(units.size());
    UnitMap& map = state_.mutableUnits();
    const Timestamp now = nowMillis();
    for (const auto& src : units) {
        InformationUnit u = src;
        u.id = next_unit_id_++;
        u.sequence_index = next_sequence_++;
        if (u.created_at == 0) u.created_at = now;
        ids.push_back(u.id);
        map.emplace(u.id, std::move(u));
    }
    checkCollapse();
    return ids;
}

ContextDelta ProcessingContext::observe(uint64_t unit_id, const Signal& cues) {
    ensureWritable();
    const InformationUnit* unit = state_.findUnit(unit_id);
    if (!unit) {
        throw UnknownUnitError("unknown unit id: " + std::to_string(unit_id));
    }

    const std::string identity = unit->identityKey();
    uint64_t target_id = representativeOf(identity);
    const InformationUnit& target = *state_.findUnit(target_id);

    Signal signal = cues;
    signal.repetition_count = window_.observe(identity);
    if (signal.keyword_score == 0.0) {
        signal.keyword_score = importance_.keywordScore(target);
    }

    Weight op;
    op.unit_id = target_id;
    op.delta = importance_.assign(target, signal);
    op.reason = signal.repetition_count > 1 ? WeightReason::REPETITION
                                            : WeightReason::RELEVANCE;
    return apply(op);
}

std::vector<uint64_t> ProcessingContext::ingestAndObserve(
    const std::vector<InformationUnit>& units, const Signal& cues) {
    std::vector<uint64_t> ids = ingest(units);
    for (size_t i = 0; i < ids.size(); i++) {
        if (mode_.resolved()) break;
        Signal s = cues;
        s.position = ids.size() > 1 ? static_cast<double>(i) / ids.size() : 0.0;
        observe(ids[i], s);
    }
    return ids;
}

ContextDelta ProcessingContext::applyLogged(const Interaction& op) {
    return engine_.apply(state_, op);
}

ContextDelta ProcessingContext::apply(const Interaction& op) {
    ensureWritable();
    ContextDelta delta = applyLogged(op);
    mode_.recordIteration();

    if (auto* tr = std::get_if<Transform>(&op)) {
        if (tr->state) invalidateContradictions(tr->unit_id);
    }

    if (auto* emit = std::get_if<Emit>(&op)) {
        double weight = emit->target == EmitTarget::UNIT
            ? state_.findUnit(emit->target_id)->weight
            : engine_.groupWeight(state_, state_.groups.at(emit->target_id));
        commit(emit->target, emit->target_id, weight, CollapseCause::FORCED);
        return delta;
    }

    checkCollapse();
    return delta;
}

void ProcessingContext::invalidateContradictions(uint64_t unit_id) {
    for (const auto& [a, b] : engine_.findContradictions(state_)) {
        if (a != unit_id && b != unit_id) continue;
        Invalidate inv;
        inv.unit_ids = {a, b};
        inv.reason = "opposing declared state";
        applyLogged(inv);
        ARBOR_LOG_INFO("context", "context %llu: units %llu and %llu contested",
                       static_cast<unsigned long long>(id_),
                       static_cast<unsigned long long>(a),
                       static_cast<unsigned long long>(b));
    }
}

ContextDelta ProcessingContext::revert(uint64_t seq) {
    ensureWritable();
    if (seq == 0 || seq > state_.log.size()) {
        throw InvalidInteractionError("no logged interaction with seq " + std::to_string(seq));
    }
    const LoggedInteraction& entry = state_.log[seq - 1];
    if (!std::holds_alternative<Transform>(entry.op) || entry.delta.payload_changes.empty()) {
        throw InvalidInteractionError("interaction " + std::to_string(seq) +
                                      " is not a revertible transform");
    }
    const PayloadChange& change = entry.delta.payload_changes.front();
    Transform inverse;
    inverse.unit_id = change.unit_id;
    inverse.payload = change.before;
    if (!entry.delta.state_changes.empty()) {
        inverse.state = entry.delta.state_changes.front().before;
    }
    return apply(inverse);
}

void ProcessingContext::step() {
    ensureWritable();
    mode_.recordIteration();
    checkCollapse();
}

const EmitRecord& ProcessingContext::resolve() {
    if (result_) return *result_;
    ensureWritable();
    collapse(CollapseCause::FORCED);
    return *result_;
}

void ProcessingContext::adopt(const EmitRecord& child_result) {
    ensureWritable();
    for (const auto& child_unit : child_result.units) {
        uint64_t target = 0;
        const InformationUnit* mine = state_.findUnit(child_unit.id);
        if (mine && mine->identityKey() == child_unit.identityKey()) {
            target = mine->id;
        } else {
            InformationUnit fresh = child_unit;
            fresh.weight = 0.0;
            target = ingest({fresh}).front();
            if (mode_.resolved()) return;
        }
        double gap = child_unit.weight - state_.findUnit(target)->weight;
        if (gap > 0.0) {
            Weight w;
            w.unit_id = target;
            w.delta = gap;
            w.reason = WeightReason::MERGE;
            apply(w);
            if (mode_.resolved()) return;
        }
    }
}

void ProcessingContext::cancel() {
    if (cancelled_) return;
    cancelled_ = true;
    state_ = ContextState();
    window_ = RepetitionWindow(config_.importance.window_size);
    result_.reset();
    ARBOR_LOG_DEBUG("context", "context %llu cancelled", static_cast<unsigned long long>(id_));
}

std::unique_ptr<ProcessingContext> ProcessingContext::fork(uint64_t new_id) const {
    ensureWritable();
    return std::make_unique<ProcessingContext>(ForkTag{}, *this, new_id);
}

// ─── Collapse ─────────────────────────────────────────────────

void ProcessingContext::checkCollapse() {
    if (mode_.resolved()) return;
    if (auto candidate = mode_.thresholdCandidate(state_, engine_)) {
        Emit emit{candidate->target, candidate->id};
        applyLogged(emit);
        commit(candidate->target, candidate->id, candidate->weight, CollapseCause::THRESHOLD);
        return;
    }
    if (mode_.budgetExhausted()) {
        collapse(CollapseCause::BUDGET);
    }
}

void ProcessingContext::collapse(CollapseCause cause) {
    CollapseCandidate candidate;
    try {
        candidate = mode_.selectCandidate(state_, engine_);
    } catch (const NoSignalError&) {
        ARBOR_LOG_WARN("context", "context %llu has no signal; discarding",
                       static_cast<unsigned long long>(id_));
        cancel();
        throw;
    }
    Emit emit{candidate.target, candidate.id};
    applyLogged(emit);
    commit(candidate.target, candidate.id, candidate.weight, cause);
}

void ProcessingContext::commit(EmitTarget target, uint64_t target_id, double weight,
                               CollapseCause cause) {
    EmitRecord record;
    record.context_id = id_;
    record.target = target;
    record.target_id = target_id;
    record.weight = weight;
    record.cause = cause;
    if (target == EmitTarget::UNIT) {
        record.unit_ids = {target_id};
    } else {
        record.unit_ids = state_.groups.at(target_id).members;
    }
    for (uint64_t uid : record.unit_ids) {
        record.units.push_back(*state_.findUnit(uid));
    }
    result_ = std::move(record);
    mode_.markResolved(cause);

    ARBOR_LOG_INFO("context", "context %llu resolved (%s) on %s %llu weight=%.4f",
                   static_cast<unsigned long long>(id_), collapseCauseName(cause),
                   emitTargetName(target), static_cast<unsigned long long>(target_id),
                   weight);
}

} // namespace arbor
