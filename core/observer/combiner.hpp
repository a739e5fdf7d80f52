#pragma once

#include "observer/observer.hpp"
#include "unit/information_unit.hpp"

#include <memory>
#include <string>
#include <vector>

namespace arbor {

struct CombinerConfig {
    bool parallel = true;          // run observers on separate threads
    double base_weight = 0.01;     // weight of a fully disagreeing key
    double agreement_bonus = 0.1;  // added in proportion to agreement
};

/// Joint observation of N observers.
struct CombinedKey {
    std::string key;                    // symbols concatenated in declared order
    std::vector<Symbol> symbols;
    std::vector<std::string> observer_names;
    double agreement = 0.0;             // modal symbol count / observer count
    InformationUnit unit;               // the COMBINED unit built from the key
};

using ObserverSet = std::vector<std::shared_ptr<const Observer>>;

// ─── Combiner ─────────────────────────────────────────────────
// Runs every observer on its own copy of the unit, waits for all of
// them, then concatenates their symbols. There is no partial key:
// if any observer fails, the first failure is rethrown after every
// observer has returned.

class Combiner {
public:
    explicit Combiner(CombinerConfig config = {}) : config_(config) {}

    CombinedKey combine(const InformationUnit& unit, const ObserverSet& observers) const;

    /// Throws InvalidObserverError for a null observer, an empty or
    /// duplicated alphabet, or a stochastic observer without seed.
    static void validate(const ObserverSet& observers);

    const CombinerConfig& config() const { return config_; }

private:
    CombinerConfig config_;
};

} // namespace arbor
