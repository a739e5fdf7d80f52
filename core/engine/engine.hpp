#pragma once

#include "atomizer/atomizer.hpp"
#include "engine/engine_config.hpp"
#include "memory/lineage_store.hpp"
#include "observer/combiner.hpp"
#include "pipeline/pipeline_manager.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

/// Per-call options for Engine::submit.
struct SubmitOptions {
    std::string name;                   // entry to persist into; default observation/<seed>
    std::optional<std::string> parent;  // lineage parent of that entry
    std::string source;                 // source identity for the origin seed
    std::vector<std::string> keywords;  // extra keywords for this input only
    double urgency = 0.0;               // caller-declared urgency cue
};

struct SubmitResult {
    CombinedKey key;
    std::string name;        // entry the observation was persisted into
    EmitRecord emit;         // what the context committed to
};

// ─── Engine ───────────────────────────────────────────────────
// End-to-end surface: Atomizer → context (importance, interactions,
// collapse) → Combiner → Lineage Store. Safe to call submit() from
// several threads; each call owns its context and the store
// serializes the writes.

class Engine {
public:
    explicit Engine(EngineConfig config = {});

    /// Open the store (snapshot + log replay).
    void open();

    /// Process one input and persist the joint observation. On any
    /// failure the context is cancelled, nothing is persisted, and the
    /// typed error propagates.
    SubmitResult submit(const std::string& raw_input, const ObserverSet& observers,
                        const SubmitOptions& options = {});

    /// Exact name → that entry alone; otherwise every entry whose name
    /// starts with the argument. Empty when nothing matches.
    std::vector<MemoryEntry> retrieve(const std::string& name_or_prefix) const;

    LineageStore& store() { return store_; }
    const LineageStore& store() const { return store_; }
    PipelineManager& pipeline() { return pipeline_; }
    const Atomizer& atomizer() const { return atomizer_; }
    const Combiner& combiner() const { return combiner_; }
    const EngineConfig& config() const { return config_; }

    /// Default entry name for an origin seed: observation/<16 hex digits>.
    static std::string defaultName(uint64_t origin_seed);

private:
    EngineConfig config_;
    Atomizer atomizer_;
    PipelineManager pipeline_;
    Combiner combiner_;
    LineageStore store_;

    static std::string describe(const CombinedKey& key, const EmitRecord& emit);
};

} // namespace arbor
