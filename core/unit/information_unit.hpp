#pragma once

#include "common/clock.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace arbor {

// ─── Kinds and States ──────────────────────────────────────────

enum class UnitKind : uint8_t {
    TOKEN,
    SENTENCE,
    FIELD,
    COMBINED
};

enum class UnitState : uint8_t {
    POS,
    NEG,
    NEUTRAL,
    UNRESOLVED,
    CONTESTED
};

const char* kindName(UnitKind kind);
const char* stateName(UnitState state);
std::optional<UnitKind> parseKind(const std::string& name);
std::optional<UnitState> parseState(const std::string& name);

// ─── Payloads ──────────────────────────────────────────────────
// Closed set of typed payloads. The kind of a unit is whichever
// alternative is active, so kind and value can never disagree.

struct TokenValue {
    std::string text;
};

struct SentenceValue {
    std::string text;
    size_t token_count = 0;
};

struct FieldValue {
    std::string key;
    std::string value;
};

struct CombinedValue {
    std::string key;                   // concatenated observer symbols
    std::vector<std::string> symbols;  // one per observer, declared order
    double agreement = 0.0;            // modal symbol count / observer count
};

bool operator==(const TokenValue& a, const TokenValue& b);
bool operator==(const SentenceValue& a, const SentenceValue& b);
bool operator==(const FieldValue& a, const FieldValue& b);
bool operator==(const CombinedValue& a, const CombinedValue& b);

using UnitPayload = std::variant<TokenValue, SentenceValue, FieldValue, CombinedValue>;

UnitKind kindOf(const UnitPayload& payload);

/// Canonical string form used for identity and display.
/// FIELD renders as "key=value".
std::string canonicalValue(const UnitPayload& payload);

// ─── InformationUnit ──────────────────────────────────────────
/// Atomic piece of information. Created by the Atomizer (or the
/// Combiner), mutated only through logged interactions.

struct InformationUnit {
    uint64_t id = 0;
    UnitPayload payload;
    UnitState state = UnitState::UNRESOLVED;
    double weight = 0.0;
    uint64_t origin_seed = 0;
    uint64_t sequence_index = 0;
    Timestamp created_at = 0;

    UnitKind kind() const { return kindOf(payload); }
    std::string value() const { return canonicalValue(payload); }

    /// (kind, value) identity. Same value under a different kind is a
    /// different identity.
    std::string identityKey() const;
};

bool operator==(const InformationUnit& a, const InformationUnit& b);
bool operator!=(const InformationUnit& a, const InformationUnit& b);

/// Ordered by id so iteration (and therefore tie-breaking and
/// serialization) is deterministic.
using UnitMap = std::map<uint64_t, InformationUnit>;

} // namespace arbor
