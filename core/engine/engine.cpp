#include "engine/engine.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <cstdio>
#include <sstream>

namespace arbor {

namespace {

EngineConfig validated(EngineConfig config) {
    validateEngineConfig(config);
    setLogLevel(config.log_level);
    return config;
}

} // namespace

Engine::Engine(EngineConfig config)
    : config_(validated(std::move(config))),
      atomizer_(config_.atomizer),
      pipeline_(config_.pipeline),
      combiner_(config_.combiner),
      store_(config_.store) {}

void Engine::open() {
    store_.open();
}

std::string Engine::defaultName(uint64_t origin_seed) {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "observation/%016llx",
                  static_cast<unsigned long long>(origin_seed));
    return buf;
}

std::string Engine::describe(const CombinedKey& key, const EmitRecord& emit) {
    const InformationUnit& rep = emit.representative();
    std::ostringstream oss;
    oss << "key=" << key.key
        << " agreement=" << key.agreement
        << " emit=" << rep.value()
        << " kind=" << kindName(rep.kind())
        << " weight=" << emit.weight
        << " cause=" << collapseCauseName(emit.cause);
    return oss.str();
}

SubmitResult Engine::submit(const std::string& raw_input, const ObserverSet& observers,
                            const SubmitOptions& options) {
    // Reject a bad observer set before any work is done.
    Combiner::validate(observers);

    std::vector<InformationUnit> units = atomizer_.atomize(raw_input, options.source);

    uint64_t context_id = pipeline_.create();
    try {
        auto ctx = pipeline_.acquire(context_id);

        Signal cues;
        cues.urgency = options.urgency;
        if (options.keywords.empty()) {
            ctx->ingestAndObserve(units, cues);
        } else {
            ImportanceConfig extra;
            extra.keywords = options.keywords;
            ImportanceAssigner scorer(extra);
            std::vector<uint64_t> ids = ctx->ingest(units);
            for (size_t i = 0; i < ids.size() && !ctx->resolved(); i++) {
                Signal s = cues;
                s.position = ids.size() > 1 ? static_cast<double>(i) / ids.size() : 0.0;
                s.keyword_score = scorer.keywordScore(*ctx->findUnit(ids[i]));
                ctx->observe(ids[i], s);
            }
        }

        EmitRecord emit = ctx->resolved() ? *ctx->result() : ctx->resolve();

        SubmitResult result;
        result.key = combiner_.combine(emit.representative(), observers);
        result.name = options.name.empty() ? defaultName(units.front().origin_seed)
                                           : options.name;
        result.emit = std::move(emit);

        store_.put(result.name, describe(result.key, result.emit), options.parent);
        pipeline_.archive(context_id);

        ARBOR_LOG_INFO("engine", "submitted '%s' -> key %s",
                       result.name.c_str(), result.key.key.c_str());
        return result;
    } catch (const std::exception& e) {
        ARBOR_LOG_WARN("engine", "submit failed, cancelling context %llu: %s",
                       static_cast<unsigned long long>(context_id), e.what());
        if (pipeline_.isLive(context_id)) pipeline_.cancel(context_id);
        throw;
    }
}

std::vector<MemoryEntry> Engine::retrieve(const std::string& name_or_prefix) const {
    if (auto exact = store_.find(name_or_prefix)) {
        return {*exact};
    }
    return store_.withPrefix(name_or_prefix);
}

} // namespace arbor
