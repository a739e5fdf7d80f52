#pragma once

#include "atomizer/atomize_strategy.hpp"
#include "unit/information_unit.hpp"

#include <memory>
#include <string>
#include <vector>

namespace arbor {

/// Atomizer configuration.
struct AtomizerConfig {
    std::string strategy = "word";     // see atomizeStrategyNames()
    double base_weight = 0.01;         // initial weight of every unit
    size_t max_units = 4096;           // extra units are dropped with a warning
    size_t max_input_bytes = 1 << 20;  // larger inputs are rejected
};

// ─── Atomizer ─────────────────────────────────────────────────
// Cuts raw input into InformationUnits through a pluggable strategy.
// Never returns an empty list: empty or unparseable input raises
// InvalidInputError, input that splits into nothing raises
// ExhaustedInputError.

class Atomizer {
public:
    explicit Atomizer(AtomizerConfig config = {});
    Atomizer(AtomizerConfig config, std::unique_ptr<AtomizeStrategy> strategy);

    /// Split `raw` into units. `source_identity` names where the input
    /// came from; the origin seed is its stable hash. Defaults to the
    /// input itself.
    std::vector<InformationUnit> atomize(const std::string& raw,
                                         const std::string& source_identity = "") const;

    const AtomizeStrategy& strategy() const { return *strategy_; }
    const AtomizerConfig& config() const { return config_; }

private:
    AtomizerConfig config_;
    std::unique_ptr<AtomizeStrategy> strategy_;
};

} // namespace arbor
