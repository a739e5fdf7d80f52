#include "observer/observer.hpp"
#include "common/errors.hpp"
#include "common/hash.hpp"

#include <random>

namespace arbor {

Alphabet binaryAlphabet() {
    return {"0", "1"};
}

// ─── FunctionObserver ─────────────────────────────────────────

FunctionObserver::FunctionObserver(std::string name, Alphabet alphabet, Fn fn)
    : name_(std::move(name)), alphabet_(std::move(alphabet)), fn_(std::move(fn)) {
    if (!fn_) {
        throw InvalidObserverError("observer '" + name_ + "' has no function");
    }
}

Symbol FunctionObserver::observe(const InformationUnit& unit) const {
    return fn_(unit);
}

// ─── SeededObserver ───────────────────────────────────────────

SeededObserver::SeededObserver(std::string name, Alphabet alphabet, uint64_t seed)
    : name_(std::move(name)), alphabet_(std::move(alphabet)), seed_(seed) {
    if (alphabet_.empty()) {
        throw InvalidObserverError("observer '" + name_ + "' has an empty alphabet");
    }
}

Symbol SeededObserver::observe(const InformationUnit& unit) const {
    std::mt19937_64 rng(seed_ ^ unit.origin_seed ^ fnv1a64(unit.value()));
    std::uniform_int_distribution<size_t> pick(0, alphabet_.size() - 1);
    return alphabet_[pick(rng)];
}

// ─── ContainsObserver ─────────────────────────────────────────

ContainsObserver::ContainsObserver(std::string needle)
    : needle_(std::move(needle)), alphabet_(binaryAlphabet()) {}

Symbol ContainsObserver::observe(const InformationUnit& unit) const {
    return unit.value().find(needle_) != std::string::npos ? "1" : "0";
}

} // namespace arbor
