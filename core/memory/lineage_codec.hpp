#pragma once

#include "memory/memory_entry.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace arbor {

using json = nlohmann::json;

// ─── Persistence Format ───────────────────────────────────────
// {
//   "<name>": {
//     "history": [{"timestamp": "...", "text": "..."}],
//     "parent": "<name>" | null,
//     "children": ["<name>", ...],
//     "stability_label": "..." | null
//   }
// }

json entryToJson(const MemoryEntry& entry);
MemoryEntry entryFromJson(const std::string& name, const json& j);

/// Whole-store document. `indent` < 0 gives the compact form.
std::string encodeEntries(const EntryMap& entries, int indent = 2);

/// Inverse of encodeEntries. Throws StoreIOError on malformed input.
EntryMap decodeEntries(const std::string& text);

// ─── Append-only Log Records ──────────────────────────────────
// One JSON object per line:
//   {"op":"put","name":..,"text":..,"parent":..|null,"timestamp":..}
//   {"op":"label","name":..,"label":..}

struct LogRecord {
    enum class Op { PUT, LABEL };

    Op op = Op::PUT;
    std::string name;
    std::string text;                   // PUT
    std::optional<std::string> parent;  // PUT
    std::string timestamp;              // PUT
    std::string label;                  // LABEL
};

std::string encodeLogRecord(const LogRecord& record);

/// Throws StoreIOError on a malformed line.
LogRecord decodeLogRecord(const std::string& line);

} // namespace arbor
