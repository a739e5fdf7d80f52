#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace arbor {

// ─── Memory Entry ─────────────────────────────────────────────
// A named, append-only record in the lineage store. parent_name is
// set at most once; children_names holds every name that declared
// this entry as its parent.

struct HistoryRecord {
    std::string timestamp;   // ISO-8601 UTC
    std::string text;
};

struct MemoryEntry {
    std::string name;
    std::vector<HistoryRecord> history;
    std::optional<std::string> parent_name;
    std::set<std::string> children_names;
    std::optional<std::string> stability_label;

    /// Created only to anchor children; nothing written to it yet.
    bool isStub() const { return history.empty(); }
};

bool operator==(const HistoryRecord& a, const HistoryRecord& b);
bool operator==(const MemoryEntry& a, const MemoryEntry& b);

/// Name-ordered, which makes the persisted form deterministic.
using EntryMap = std::map<std::string, MemoryEntry>;

} // namespace arbor
