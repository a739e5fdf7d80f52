#pragma once

#include "pipeline/processing_context.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace arbor {

struct PipelineConfig {
    size_t max_live_contexts = 64;   // create()/fork() beyond this raise CapacityExceededError
    size_t archive_capacity = 1024;  // resolved results kept after archive()
    ContextConfig context;
};

/// Counters for diagnostics.
struct PipelineStats {
    size_t live = 0;
    size_t archived = 0;
    uint64_t created = 0;
    uint64_t forked = 0;
    uint64_t cancelled = 0;
    uint64_t rejected = 0;   // CapacityExceededError count
};

// ─── Pipeline Manager ─────────────────────────────────────────
// Registry of live contexts with a capacity bound. The registry lock
// only guards the map; a context handed out by acquire() is used by
// one thread at a time without further locking.

class PipelineManager {
public:
    explicit PipelineManager(PipelineConfig config = {});

    /// New empty context. Throws CapacityExceededError when full, and
    /// UnknownContextError for an unknown parent.
    uint64_t create(std::optional<uint64_t> parent_id = std::nullopt);

    /// Copy-on-write fork of a live, exploratory context.
    uint64_t fork(uint64_t context_id);

    /// Live context by id. Throws UnknownContextError.
    std::shared_ptr<ProcessingContext> acquire(uint64_t context_id) const;

    /// Emit of a live or archived context; nullopt while exploratory.
    std::optional<EmitRecord> getResult(uint64_t context_id) const;

    /// Move a resolved context's result to the archive and free its slot.
    /// Throws ContextNotResolvedError while exploratory.
    void archive(uint64_t context_id);

    /// Discard a live context. No result is kept.
    void cancel(uint64_t context_id);

    /// Propagate a resolved child's Emit into its live parent.
    void merge(uint64_t child_id, uint64_t parent_id);

    bool isLive(uint64_t context_id) const;
    size_t liveCount() const;
    PipelineStats stats() const;
    const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::unordered_map<uint64_t, std::shared_ptr<ProcessingContext>> live_;
    std::unordered_map<uint64_t, EmitRecord> archive_;
    std::deque<uint64_t> archive_order_;
    PipelineStats stats_;

    void requireCapacityLocked();
    std::shared_ptr<ProcessingContext> findLocked(uint64_t context_id) const;
};

} // namespace arbor
