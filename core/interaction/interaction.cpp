#include "interaction/interaction.hpp"
#include "common/errors.hpp"

namespace arbor {

const char* weightReasonName(WeightReason reason) {
    switch (reason) {
        case WeightReason::REPETITION: return "REPETITION";
        case WeightReason::RELEVANCE:  return "RELEVANCE";
        case WeightReason::MANUAL:     return "MANUAL";
        case WeightReason::MERGE:      return "MERGE";
        case WeightReason::AGREEMENT:  return "AGREEMENT";
    }
    return "UNKNOWN";
}

const char* emitTargetName(EmitTarget target) {
    return target == EmitTarget::UNIT ? "UNIT" : "GROUP";
}

const char* collapseCauseName(CollapseCause cause) {
    switch (cause) {
        case CollapseCause::THRESHOLD: return "THRESHOLD";
        case CollapseCause::FORCED:    return "FORCED";
        case CollapseCause::BUDGET:    return "BUDGET";
    }
    return "UNKNOWN";
}

const char* interactionName(const Interaction& op) {
    static const char* const names[] = {"link", "transform", "invalidate", "weight", "emit"};
    return names[op.index()];
}

const InformationUnit& EmitRecord::representative() const {
    if (units.empty()) {
        throw NoSignalError("emit record of context " + std::to_string(context_id) +
                            " holds no units");
    }
    const InformationUnit* best = &units.front();
    for (const auto& u : units) {
        if (u.weight > best->weight ||
            (u.weight == best->weight && u.sequence_index < best->sequence_index)) {
            best = &u;
        }
    }
    return *best;
}

} // namespace arbor
