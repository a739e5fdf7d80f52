#pragma once

#include "unit/information_unit.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

using Symbol = std::string;

/// Finite set of symbols an observer may answer with.
using Alphabet = std::vector<Symbol>;

/// {"0", "1"}
Alphabet binaryAlphabet();

// ─── Observer ─────────────────────────────────────────────────
// One independent interpreter: maps a read-only unit snapshot to
// exactly one symbol of its declared alphabet. Implementations must
// not keep state between calls. Stochastic observers must carry a
// seed so repeated runs give the same key.

class Observer {
public:
    virtual ~Observer() = default;

    virtual std::string name() const = 0;
    virtual const Alphabet& alphabet() const = 0;
    virtual bool deterministic() const = 0;
    virtual std::optional<uint64_t> seed() const { return std::nullopt; }

    virtual Symbol observe(const InformationUnit& unit) const = 0;
};

/// Deterministic observer around a callable.
class FunctionObserver : public Observer {
public:
    using Fn = std::function<Symbol(const InformationUnit&)>;

    FunctionObserver(std::string name, Alphabet alphabet, Fn fn);

    std::string name() const override { return name_; }
    const Alphabet& alphabet() const override { return alphabet_; }
    bool deterministic() const override { return true; }
    Symbol observe(const InformationUnit& unit) const override;

private:
    std::string name_;
    Alphabet alphabet_;
    Fn fn_;
};

/// Stochastic observer. Draws uniformly from its alphabet with a
/// generator seeded by seed ^ origin_seed ^ hash(value), so the same
/// unit always yields the same symbol.
class SeededObserver : public Observer {
public:
    SeededObserver(std::string name, Alphabet alphabet, uint64_t seed);

    std::string name() const override { return name_; }
    const Alphabet& alphabet() const override { return alphabet_; }
    bool deterministic() const override { return false; }
    std::optional<uint64_t> seed() const override { return seed_; }
    Symbol observe(const InformationUnit& unit) const override;

private:
    std::string name_;
    Alphabet alphabet_;
    uint64_t seed_;
};

/// Deterministic observer answering "1" when the unit value contains
/// the needle, "0" otherwise.
class ContainsObserver : public Observer {
public:
    explicit ContainsObserver(std::string needle);

    std::string name() const override { return "contains:" + needle_; }
    const Alphabet& alphabet() const override { return alphabet_; }
    bool deterministic() const override { return true; }
    Symbol observe(const InformationUnit& unit) const override;

private:
    std::string needle_;
    Alphabet alphabet_;
};

} // namespace arbor
