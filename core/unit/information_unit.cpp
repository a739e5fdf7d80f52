#include "unit/information_unit.hpp"

namespace arbor {

const char* kindName(UnitKind kind) {
    switch (kind) {
        case UnitKind::TOKEN:    return "TOKEN";
        case UnitKind::SENTENCE: return "SENTENCE";
        case UnitKind::FIELD:    return "FIELD";
        case UnitKind::COMBINED: return "COMBINED";
    }
    return "UNKNOWN";
}

const char* stateName(UnitState state) {
    switch (state) {
        case UnitState::POS:        return "POS";
        case UnitState::NEG:        return "NEG";
        case UnitState::NEUTRAL:    return "NEUTRAL";
        case UnitState::UNRESOLVED: return "UNRESOLVED";
        case UnitState::CONTESTED:  return "CONTESTED";
    }
    return "UNKNOWN";
}

std::optional<UnitKind> parseKind(const std::string& name) {
    if (name == "TOKEN")    return UnitKind::TOKEN;
    if (name == "SENTENCE") return UnitKind::SENTENCE;
    if (name == "FIELD")    return UnitKind::FIELD;
    if (name == "COMBINED") return UnitKind::COMBINED;
    return std::nullopt;
}

std::optional<UnitState> parseState(const std::string& name) {
    if (name == "POS")        return UnitState::POS;
    if (name == "NEG")        return UnitState::NEG;
    if (name == "NEUTRAL")    return UnitState::NEUTRAL;
    if (name == "UNRESOLVED") return UnitState::UNRESOLVED;
    if (name == "CONTESTED")  return UnitState::CONTESTED;
    return std::nullopt;
}

bool operator==(const TokenValue& a, const TokenValue& b) {
    return a.text == b.text;
}

bool operator==(const SentenceValue& a, const SentenceValue& b) {
    return a.text == b.text && a.token_count == b.token_count;
}

bool operator==(const FieldValue& a, const FieldValue& b) {
    return a.key == b.key && a.value == b.value;
}

bool operator==(const CombinedValue& a, const CombinedValue& b) {
    return a.key == b.key && a.symbols == b.symbols && a.agreement == b.agreement;
}

UnitKind kindOf(const UnitPayload& payload) {
    switch (payload.index()) {
        case 0: return UnitKind::TOKEN;
        case 1: return UnitKind::SENTENCE;
        case 2: return UnitKind::FIELD;
        default: return UnitKind::COMBINED;
    }
}

std::string canonicalValue(const UnitPayload& payload) {
    if (auto* t = std::get_if<TokenValue>(&payload)) return t->text;
    if (auto* s = std::get_if<SentenceValue>(&payload)) return s->text;
    if (auto* f = std::get_if<FieldValue>(&payload)) return f->key + "=" + f->value;
    return std::get<CombinedValue>(payload).key;
}

std::string InformationUnit::identityKey() const {
    // Unit separator keeps "TOKEN" + "a" distinct from any value that
    // happens to contain the kind name.
    return std::string(kindName(kind())) + '\x1f' + value();
}

bool operator==(const InformationUnit& a, const InformationUnit& b) {
    return a.id == b.id && a.payload == b.payload && a.state == b.state &&
           a.weight == b.weight && a.origin_seed == b.origin_seed &&
           a.sequence_index == b.sequence_index && a.created_at == b.created_at;
}

bool operator!=(const InformationUnit& a, const InformationUnit& b) {
    return !(a == b);
}

} // namespace arbor
