#include "memory/lineage_codec.hpp"
#include "common/errors.hpp"

namespace arbor {

bool operator==(const HistoryRecord& a, const HistoryRecord& b) {
    return a.timestamp == b.timestamp && a.text == b.text;
}

bool operator==(const MemoryEntry& a, const MemoryEntry& b) {
    return a.name == b.name && a.history == b.history &&
           a.parent_name == b.parent_name && a.children_names == b.children_names &&
           a.stability_label == b.stability_label;
}

namespace {

json optionalString(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

std::optional<std::string> readOptionalString(const json& j, const char* key,
                                              const std::string& name) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw StoreIOError("entry '" + name + "': '" + key + "' must be a string or null");
    }
    return it->get<std::string>();
}

} // namespace

json entryToJson(const MemoryEntry& entry) {
    json history = json::array();
    for (const auto& h : entry.history) {
        history.push_back({{"timestamp", h.timestamp}, {"text", h.text}});
    }
    json children = json::array();
    for (const auto& c : entry.children_names) {
        children.push_back(c);
    }
    return json{
        {"history", std::move(history)},
        {"parent", optionalString(entry.parent_name)},
        {"children", std::move(children)},
        {"stability_label", optionalString(entry.stability_label)},
    };
}

MemoryEntry entryFromJson(const std::string& name, const json& j) {
    if (!j.is_object()) {
        throw StoreIOError("entry '" + name + "' is not an object");
    }
    MemoryEntry entry;
    entry.name = name;

    auto hist = j.find("history");
    if (hist != j.end()) {
        if (!hist->is_array()) {
            throw StoreIOError("entry '" + name + "': history must be an array");
        }
        for (const auto& h : *hist) {
            if (!h.is_object() || !h.contains("timestamp") || !h.contains("text") ||
                !h["timestamp"].is_string() || !h["text"].is_string()) {
                throw StoreIOError("entry '" + name + "': malformed history record");
            }
            entry.history.push_back({h["timestamp"].get<std::string>(),
                                     h["text"].get<std::string>()});
        }
    }

    entry.parent_name = readOptionalString(j, "parent", name);
    entry.stability_label = readOptionalString(j, "stability_label", name);

    auto children = j.find("children");
    if (children != j.end()) {
        if (!children->is_array()) {
            throw StoreIOError("entry '" + name + "': children must be an array");
        }
        for (const auto& c : *children) {
            if (!c.is_string()) {
                throw StoreIOError("entry '" + name + "': child names must be strings");
            }
            entry.children_names.insert(c.get<std::string>());
        }
    }
    return entry;
}

std::string encodeEntries(const EntryMap& entries, int indent) {
    json doc = json::object();
    for (const auto& [name, entry] : entries) {
        doc[name] = entryToJson(entry);
    }
    try {
        return doc.dump(indent);
    } catch (const json::exception& e) {
        throw StoreIOError(std::string("cannot encode store document: ") + e.what());
    }
}

EntryMap decodeEntries(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw StoreIOError(std::string("malformed store document: ") + e.what());
    }
    if (!doc.is_object()) {
        throw StoreIOError("store document must be an object");
    }
    EntryMap entries;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        entries.emplace(it.key(), entryFromJson(it.key(), it.value()));
    }
    return entries;
}

std::string encodeLogRecord(const LogRecord& record) {
    json j;
    if (record.op == LogRecord::Op::PUT) {
        j = {{"op", "put"},
             {"name", record.name},
             {"text", record.text},
             {"parent", optionalString(record.parent)},
             {"timestamp", record.timestamp}};
    } else {
        j = {{"op", "label"}, {"name", record.name}, {"label", record.label}};
    }
    try {
        return j.dump();
    } catch (const json::exception& e) {
        throw StoreIOError("cannot encode log record for '" + record.name + "': " + e.what());
    }
}

LogRecord decodeLogRecord(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        throw StoreIOError(std::string("malformed log line: ") + e.what());
    }
    if (!j.is_object() || !j.contains("op") || !j.contains("name") ||
        !j["op"].is_string() || !j["name"].is_string()) {
        throw StoreIOError("log line lacks op/name");
    }

    LogRecord record;
    record.name = j["name"].get<std::string>();
    const std::string op = j["op"].get<std::string>();
    try {
        if (op == "put") {
            record.op = LogRecord::Op::PUT;
            record.text = j.value("text", "");
            record.timestamp = j.value("timestamp", "");
            record.parent = readOptionalString(j, "parent", record.name);
        } else if (op == "label") {
            record.op = LogRecord::Op::LABEL;
            record.label = j.value("label", "");
        } else {
            throw StoreIOError("unknown log op '" + op + "'");
        }
    } catch (const json::type_error& e) {
        throw StoreIOError("log record for '" + record.name + "': " + e.what());
    }
    return record;
}

} // namespace arbor
