#include "observer/combiner.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <map>
#include <set>

namespace arbor {

void Combiner::validate(const ObserverSet& observers) {
    if (observers.empty()) {
        throw InvalidObserverError("combine requires at least one observer");
    }
    for (const auto& obs : observers) {
        if (!obs) {
            throw InvalidObserverError("null observer");
        }
        const Alphabet& alphabet = obs->alphabet();
        if (alphabet.empty()) {
            throw InvalidObserverError("observer '" + obs->name() + "' has an empty alphabet");
        }
        std::set<Symbol> unique(alphabet.begin(), alphabet.end());
        if (unique.size() != alphabet.size()) {
            throw InvalidObserverError("observer '" + obs->name() + "' repeats a symbol");
        }
        if (!obs->deterministic() && !obs->seed()) {
            throw InvalidObserverError("stochastic observer '" + obs->name() +
                                       "' declares no seed");
        }
    }
}

CombinedKey Combiner::combine(const InformationUnit& unit, const ObserverSet& observers) const {
    validate(observers);

    // Each observer gets its own snapshot; none can see another's input
    // or output.
    std::vector<std::future<Symbol>> pending;
    pending.reserve(observers.size());
    const auto policy = config_.parallel ? std::launch::async : std::launch::deferred;
    for (const auto& obs : observers) {
        pending.push_back(std::async(policy, [obs, snapshot = unit]() {
            return obs->observe(snapshot);
        }));
    }

    // Join every observer before looking at any result.
    std::vector<Symbol> symbols(observers.size());
    std::exception_ptr first_failure;
    for (size_t i = 0; i < pending.size(); i++) {
        try {
            symbols[i] = pending[i].get();
        } catch (const std::exception& e) {
            ARBOR_LOG_WARN("combiner", "observer '%s' failed: %s",
                           observers[i]->name().c_str(), e.what());
            if (!first_failure) first_failure = std::current_exception();
        }
    }
    if (first_failure) std::rethrow_exception(first_failure);

    CombinedKey result;
    std::map<Symbol, int> tally;
    for (size_t i = 0; i < observers.size(); i++) {
        const Alphabet& alphabet = observers[i]->alphabet();
        if (std::find(alphabet.begin(), alphabet.end(), symbols[i]) == alphabet.end()) {
            throw InvalidSymbolError("observer '" + observers[i]->name() +
                                     "' answered '" + symbols[i] +
                                     "' outside its alphabet");
        }
        result.key += symbols[i];
        result.observer_names.push_back(observers[i]->name());
        tally[symbols[i]]++;
    }

    int modal = 0;
    for (const auto& [sym, count] : tally) modal = std::max(modal, count);
    result.agreement = static_cast<double>(modal) / observers.size();
    result.symbols = symbols;

    InformationUnit& u = result.unit;
    u.id = 1;
    u.payload = CombinedValue{result.key, symbols, result.agreement};
    u.state = UnitState::UNRESOLVED;
    u.weight = config_.base_weight + config_.agreement_bonus * result.agreement;
    u.origin_seed = unit.origin_seed;
    u.sequence_index = 0;
    u.created_at = nowMillis();

    ARBOR_LOG_DEBUG("combiner", "key=%s agreement=%.3f over %zu observers",
                    result.key.c_str(), result.agreement, observers.size());
    return result;
}

} // namespace arbor
