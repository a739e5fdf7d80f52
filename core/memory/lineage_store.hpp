#pragma once

#include "memory/lineage_codec.hpp"
#include "memory/memory_entry.hpp"

#include <atomic>
#include <fstream>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace arbor {

struct StoreConfig {
    std::string log_path;        // append-only write log; empty = memory only
    std::string snapshot_path;   // full document loaded by open(), written by compact()
};

// ─── Lineage Store ────────────────────────────────────────────
// Append-only, parent/child-tracked record of named observations.
//
// put() is the single serialization point of the system: it holds the
// exclusive lock for the whole read-modify-write, and appends the
// record to the log before touching memory. Readers take the shared
// lock and get copies, so they never see a half-written entry.
//
// Referential integrity: for every entry e with parent p, p exists
// and e is in p's children. Parents are created as stubs on demand.

class LineageStore {
public:
    explicit LineageStore(StoreConfig config = {});
    ~LineageStore();

    LineageStore(const LineageStore&) = delete;
    LineageStore& operator=(const LineageStore&) = delete;

    /// Load the snapshot (if present), replay the log, and open the log
    /// for appending. A no-op for a memory-only store.
    void open();

    // ── Writes ──

    /// Create or append. The parent is recorded the first time one is
    /// given; a later, different parent is ignored. Throws
    /// InvalidLineageError for an empty name, self-parenting or a cycle,
    /// InvalidInputError for a name, parent or text that is not UTF-8,
    /// StoreIOError when the log append fails, WriteConflictError once
    /// the single-writer guarantee has been broken.
    void put(const std::string& name, const std::string& text,
             const std::optional<std::string>& parent = std::nullopt);

    /// Throws NotFoundError for an unknown name.
    void setStabilityLabel(const std::string& name, const std::string& label);

    // ── Reads ──

    /// Throws NotFoundError.
    MemoryEntry get(const std::string& name) const;
    std::optional<MemoryEntry> find(const std::string& name) const;

    /// Throws NotFoundError.
    std::set<std::string> listChildren(const std::string& name) const;

    /// Entries whose name starts with `prefix`, name-ordered.
    std::vector<MemoryEntry> withPrefix(const std::string& prefix) const;

    bool contains(const std::string& name) const;
    size_t size() const;
    EntryMap snapshot() const;

    /// Integrity violations, empty when the store is consistent.
    std::vector<std::string> verifyIntegrity() const;

    // ── Persistence ──

    std::string serialize(int indent = 2) const;

    /// Replace the content with a serialized document. Memory-only
    /// stores, or before open(); a store with an open log refuses. Throws
    /// StoreIOError on malformed input and InvalidLineageError when the
    /// document breaks referential integrity.
    void loadSerialized(const std::string& text);

    /// Write the document atomically (temp file + rename).
    void saveSnapshot(const std::string& path) const;
    void loadSnapshot(const std::string& path);

    /// Write the snapshot and truncate the log.
    void compact();

    bool halted() const { return halted_.load(); }
    const StoreConfig& config() const { return config_; }

private:
    StoreConfig config_;
    mutable std::shared_mutex mutex_;
    EntryMap entries_;
    std::ofstream log_;
    std::atomic<bool> writer_active_{false};
    std::atomic<bool> halted_{false};

    class WriterGuard;

    void checkLineageLocked(const std::string& name,
                            const std::optional<std::string>& parent) const;
    void applyPutLocked(const std::string& name, const std::string& text,
                        const std::optional<std::string>& parent,
                        const std::string& timestamp);
    void appendLocked(const LogRecord& record);
    /// Returns true when the kept log does not end in a newline.
    bool replayLogLocked();
    void openLogLocked(std::ios::openmode mode);

    static std::vector<std::string> integrityViolations(const EntryMap& entries);
};

} // namespace arbor
