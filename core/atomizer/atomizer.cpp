#include "atomizer/atomizer.hpp"
#include "common/errors.hpp"
#include "common/hash.hpp"
#include "common/log.hpp"
#include "common/utf8.hpp"

#include <algorithm>
#include <cctype>

namespace arbor {

namespace {

void checkLimits(const AtomizerConfig& config) {
    if (config.max_units == 0) {
        throw InvalidInputError("atomizer max_units must be > 0");
    }
    if (config.max_input_bytes == 0) {
        throw InvalidInputError("atomizer max_input_bytes must be > 0");
    }
}

} // namespace

Atomizer::Atomizer(AtomizerConfig config)
    : config_(std::move(config)),
      strategy_(makeAtomizeStrategy(config_.strategy)) {
    checkLimits(config_);
}

Atomizer::Atomizer(AtomizerConfig config, std::unique_ptr<AtomizeStrategy> strategy)
    : config_(std::move(config)), strategy_(std::move(strategy)) {
    if (!strategy_) {
        throw InvalidInputError("atomizer requires a strategy");
    }
    checkLimits(config_);
    config_.strategy = strategy_->name();
}

std::vector<InformationUnit> Atomizer::atomize(const std::string& raw,
                                               const std::string& source_identity) const {
    bool blank = std::all_of(raw.begin(), raw.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        throw InvalidInputError("empty input");
    }
    if (raw.size() > config_.max_input_bytes) {
        throw InvalidInputError("input of " + std::to_string(raw.size()) +
                                " bytes exceeds limit of " +
                                std::to_string(config_.max_input_bytes));
    }
    if (!isValidUtf8(raw)) {
        throw InvalidInputError("input is not valid UTF-8");
    }

    std::vector<UnitPayload> payloads = strategy_->split(raw);
    if (payloads.empty()) {
        throw ExhaustedInputError("strategy '" + strategy_->name() +
                                  "' produced no units");
    }
    if (payloads.size() > config_.max_units) {
        ARBOR_LOG_WARN("atomizer", "truncating %zu units to %zu",
                       payloads.size(), config_.max_units);
        payloads.resize(config_.max_units);
    }

    const uint64_t seed = fnv1a64(source_identity.empty() ? raw : source_identity);
    const Timestamp now = nowMillis();

    std::vector<InformationUnit> units;
    units.reserve(payloads.size());
    for (size_t i = 0; i < payloads.size(); i++) {
        if (kindOf(payloads[i]) != strategy_->kind()) {
            throw InvalidInputError("strategy '" + strategy_->name() +
                                    "' produced a " + kindName(kindOf(payloads[i])) +
                                    " payload");
        }
        InformationUnit u;
        u.id = i + 1;
        u.payload = std::move(payloads[i]);
        u.state = UnitState::UNRESOLVED;
        u.weight = config_.base_weight;
        u.origin_seed = seed;
        u.sequence_index = i;
        u.created_at = now;
        units.push_back(std::move(u));
    }

    ARBOR_LOG_DEBUG("atomizer", "%zu %s units from %zu bytes", units.size(),
                    strategy_->name().c_str(), raw.size());
    return units;
}

} // namespace arbor
