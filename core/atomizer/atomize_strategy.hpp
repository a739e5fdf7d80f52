#pragma once

#include "unit/information_unit.hpp"

#include <memory>
#include <string>
#include <vector>

namespace arbor {

/// Base class for all splitting strategies.
/// S : raw input → [payload]
/// A strategy only cuts the input into typed payloads; ids, weights
/// and seeds are assigned by the Atomizer.
class AtomizeStrategy {
public:
    virtual ~AtomizeStrategy() = default;

    /// Registry name of this strategy ("word", "sentence", "field").
    virtual std::string name() const = 0;

    /// Kind of every payload this strategy produces.
    virtual UnitKind kind() const = 0;

    /// Split the input. Throws InvalidInputError on input the strategy
    /// cannot parse. May return an empty vector.
    virtual std::vector<UnitPayload> split(const std::string& raw) const = 0;
};

// ─── Built-in strategies ──────────────────────────────────────

/// Whitespace tokens with leading/trailing punctuation trimmed.
/// Case is kept: "Hello" and "hello" are different tokens.
class WordStrategy : public AtomizeStrategy {
public:
    std::string name() const override { return "word"; }
    UnitKind kind() const override { return UnitKind::TOKEN; }
    std::vector<UnitPayload> split(const std::string& raw) const override;
};

/// Sentences terminated by '.', '!' or '?' followed by whitespace or
/// end of input. A trailing fragment without terminator is a sentence.
class SentenceStrategy : public AtomizeStrategy {
public:
    std::string name() const override { return "sentence"; }
    UnitKind kind() const override { return UnitKind::SENTENCE; }
    std::vector<UnitPayload> split(const std::string& raw) const override;
};

/// One "key=value" or "key: value" pair per non-blank line.
class FieldStrategy : public AtomizeStrategy {
public:
    std::string name() const override { return "field"; }
    UnitKind kind() const override { return UnitKind::FIELD; }
    std::vector<UnitPayload> split(const std::string& raw) const override;
};

/// Create a built-in strategy by name. Throws InvalidInputError for an
/// unknown name.
std::unique_ptr<AtomizeStrategy> makeAtomizeStrategy(const std::string& name);

/// Names accepted by makeAtomizeStrategy.
std::vector<std::string> atomizeStrategyNames();

} // namespace arbor
