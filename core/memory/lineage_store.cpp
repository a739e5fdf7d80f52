#include "memory/lineage_store.hpp"
#include "common/clock.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "common/utf8.hpp"

#include <filesystem>
#include <mutex>
#include <sstream>

namespace arbor {

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StoreIOError("cannot open '" + path + "' for reading");
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

void requireUtf8(const char* field, const std::string& value) {
    if (!isValidUtf8(value)) {
        throw InvalidInputError(std::string(field) + " is not valid UTF-8");
    }
}

void writeFileAtomic(const std::string& path, const std::string& content) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StoreIOError("cannot open '" + tmp + "' for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            throw StoreIOError("failed writing '" + tmp + "'");
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw StoreIOError("cannot rename '" + tmp + "' to '" + path + "': " + ec.message());
    }
}

} // namespace

// ─── Writer Guard ─────────────────────────────────────────────
// Second line of defence behind the exclusive lock: if two writers
// are ever inside at once, the store halts for good.

class LineageStore::WriterGuard {
public:
    explicit WriterGuard(LineageStore& store) : store_(store) {
        if (store_.halted_.load()) {
            throw WriteConflictError("store halted after a write conflict");
        }
        if (store_.writer_active_.exchange(true)) {
            store_.halted_.store(true);
            ARBOR_LOG_ERROR("store", "concurrent writer detected; halting writes");
            throw WriteConflictError("concurrent writer detected");
        }
    }
    ~WriterGuard() { store_.writer_active_.store(false); }

    WriterGuard(const WriterGuard&) = delete;
    WriterGuard& operator=(const WriterGuard&) = delete;

private:
    LineageStore& store_;
};

// ─── Lifecycle ────────────────────────────────────────────────

LineageStore::LineageStore(StoreConfig config)
    : config_(std::move(config)) {}

LineageStore::~LineageStore() {
    if (log_.is_open()) log_.close();
}

void LineageStore::open() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!config_.snapshot_path.empty() && std::filesystem::exists(config_.snapshot_path)) {
        EntryMap loaded = decodeEntries(readFile(config_.snapshot_path));
        auto violations = integrityViolations(loaded);
        if (!violations.empty()) {
            throw InvalidLineageError("snapshot '" + config_.snapshot_path + "': " +
                                      violations.front());
        }
        entries_ = std::move(loaded);
    }
    if (!config_.log_path.empty()) {
        const bool unterminated = replayLogLocked();
        openLogLocked(std::ios::out | std::ios::app);
        if (unterminated) {
            log_ << '\n';
            log_.flush();
        }
    }
    ARBOR_LOG_INFO("store", "opened with %zu entries", entries_.size());
}

void LineageStore::openLogLocked(std::ios::openmode mode) {
    if (log_.is_open()) log_.close();
    log_.clear();
    log_.open(config_.log_path, mode);
    if (!log_) {
        throw StoreIOError("cannot open log '" + config_.log_path + "'");
    }
}

bool LineageStore::replayLogLocked() {
    if (!std::filesystem::exists(config_.log_path)) return false;
    const std::string content = readFile(config_.log_path);

    size_t applied = 0;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t nl = content.find('\n', pos);
        size_t next = nl == std::string::npos ? content.size() : nl + 1;
        std::string line = content.substr(pos, next - pos);
        if (!line.empty() && line.back() == '\n') line.pop_back();
        if (line.empty()) {
            pos = next;
            continue;
        }

        LogRecord record;
        try {
            record = decodeLogRecord(line);
        } catch (const StoreIOError& e) {
            // A torn final line is what a crash mid-append leaves behind.
            // Cut it off so the next append starts on a clean line.
            if (content.find_first_not_of('\n', next) != std::string::npos) throw;
            ARBOR_LOG_WARN("store", "dropping torn final log line: %s", e.what());
            std::error_code ec;
            std::filesystem::resize_file(config_.log_path, pos, ec);
            if (ec) {
                throw StoreIOError("cannot truncate torn log '" + config_.log_path +
                                   "': " + ec.message());
            }
            ARBOR_LOG_DEBUG("store", "replayed %zu log records", applied);
            return false;
        }
        if (record.op == LogRecord::Op::PUT) {
            applyPutLocked(record.name, record.text, record.parent, record.timestamp);
        } else {
            auto it = entries_.find(record.name);
            if (it == entries_.end()) {
                throw StoreIOError("log labels unknown entry '" + record.name + "'");
            }
            it->second.stability_label = record.label;
        }
        applied++;
        pos = next;
    }
    ARBOR_LOG_DEBUG("store", "replayed %zu log records", applied);
    return !content.empty() && content.back() != '\n';
}

// ─── Writes ───────────────────────────────────────────────────

void LineageStore::checkLineageLocked(const std::string& name,
                                      const std::optional<std::string>& parent) const {
    if (name.empty()) {
        throw InvalidLineageError("entry name must not be empty");
    }
    if (!parent) return;
    if (parent->empty()) {
        throw InvalidLineageError("parent name must not be empty");
    }
    if (*parent == name) {
        throw InvalidLineageError("'" + name + "' cannot be its own parent");
    }

    // The parent only takes effect when none is set yet.
    auto self = entries_.find(name);
    if (self != entries_.end() && self->second.parent_name) return;

    // Walking up from the parent must never reach `name`.
    std::optional<std::string> cursor = parent;
    size_t hops = 0;
    while (cursor) {
        if (*cursor == name) {
            throw InvalidLineageError("parent '" + *parent + "' would make '" + name +
                                      "' its own ancestor");
        }
        auto it = entries_.find(*cursor);
        if (it == entries_.end()) break;
        cursor = it->second.parent_name;
        if (++hops > entries_.size()) break;
    }
}

void LineageStore::applyPutLocked(const std::string& name, const std::string& text,
                                  const std::optional<std::string>& parent,
                                  const std::string& timestamp) {
    MemoryEntry& entry = entries_[name];
    entry.name = name;
    entry.history.push_back({timestamp, text});

    if (!parent) return;
    if (!entry.parent_name) {
        entry.parent_name = parent;
        MemoryEntry& p = entries_[*parent];
        p.name = *parent;
        p.children_names.insert(name);
    } else if (*entry.parent_name != *parent) {
        ARBOR_LOG_WARN("store", "parent of '%s' already '%s'; ignoring '%s'",
                       name.c_str(), entry.parent_name->c_str(), parent->c_str());
    }
}

void LineageStore::appendLocked(const LogRecord& record) {
    if (!log_.is_open()) return;
    log_ << encodeLogRecord(record) << '\n';
    log_.flush();
    if (!log_) {
        throw StoreIOError("append to log '" + config_.log_path + "' failed");
    }
}

void LineageStore::put(const std::string& name, const std::string& text,
                       const std::optional<std::string>& parent) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    WriterGuard guard(*this);

    requireUtf8("entry name", name);
    requireUtf8("entry text", text);
    if (parent) requireUtf8("parent name", *parent);
    checkLineageLocked(name, parent);

    LogRecord record;
    record.op = LogRecord::Op::PUT;
    record.name = name;
    record.text = text;
    record.parent = parent;
    record.timestamp = isoNow();

    appendLocked(record);
    applyPutLocked(record.name, record.text, record.parent, record.timestamp);
}

void LineageStore::setStabilityLabel(const std::string& name, const std::string& label) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    WriterGuard guard(*this);

    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw NotFoundError("no memory entry named '" + name + "'");
    }
    requireUtf8("stability label", label);

    LogRecord record;
    record.op = LogRecord::Op::LABEL;
    record.name = name;
    record.label = label;
    appendLocked(record);
    it->second.stability_label = label;
}

// ─── Reads ────────────────────────────────────────────────────

MemoryEntry LineageStore::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw NotFoundError("no memory entry named '" + name + "'");
    }
    return it->second;
}

std::optional<MemoryEntry> LineageStore::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::set<std::string> LineageStore::listChildren(const std::string& name) const {
    return get(name).children_names;
}

std::vector<MemoryEntry> LineageStore::withPrefix(const std::string& prefix) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<MemoryEntry> out;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        out.push_back(it->second);
    }
    return out;
}

bool LineageStore::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.count(name) > 0;
}

size_t LineageStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

EntryMap LineageStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_;
}

std::vector<std::string> LineageStore::integrityViolations(const EntryMap& entries) {
    std::vector<std::string> problems;
    for (const auto& [name, entry] : entries) {
        if (entry.name != name) {
            problems.push_back("entry '" + name + "' carries name '" + entry.name + "'");
        }
        if (entry.parent_name) {
            auto p = entries.find(*entry.parent_name);
            if (p == entries.end()) {
                problems.push_back("'" + name + "' has missing parent '" +
                                   *entry.parent_name + "'");
            } else if (!p->second.children_names.count(name)) {
                problems.push_back("'" + *entry.parent_name + "' does not list child '" +
                                   name + "'");
            }
        }
        for (const auto& child : entry.children_names) {
            auto c = entries.find(child);
            if (c == entries.end()) {
                problems.push_back("'" + name + "' lists missing child '" + child + "'");
            } else if (c->second.parent_name != name) {
                problems.push_back("'" + child + "' does not declare parent '" + name + "'");
            }
        }
    }
    return problems;
}

std::vector<std::string> LineageStore::verifyIntegrity() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return integrityViolations(entries_);
}

// ─── Persistence ──────────────────────────────────────────────

std::string LineageStore::serialize(int indent) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return encodeEntries(entries_, indent);
}

void LineageStore::loadSerialized(const std::string& text) {
    EntryMap loaded = decodeEntries(text);
    auto violations = integrityViolations(loaded);
    if (!violations.empty()) {
        throw InvalidLineageError(violations.front());
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    WriterGuard guard(*this);
    if (log_.is_open()) {
        // The log holds deltas against the current content; swapping the
        // content underneath it would corrupt the next replay.
        throw StoreIOError("cannot load a document into a store with an open log");
    }
    entries_ = std::move(loaded);
}

void LineageStore::saveSnapshot(const std::string& path) const {
    writeFileAtomic(path, serialize());
}

void LineageStore::loadSnapshot(const std::string& path) {
    loadSerialized(readFile(path));
}

void LineageStore::compact() {
    if (config_.snapshot_path.empty()) {
        throw StoreIOError("compact requires a snapshot path");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    WriterGuard guard(*this);
    writeFileAtomic(config_.snapshot_path, encodeEntries(entries_));
    if (!config_.log_path.empty()) {
        openLogLocked(std::ios::out | std::ios::trunc);
    }
    ARBOR_LOG_INFO("store", "compacted %zu entries into '%s'", entries_.size(),
                   config_.snapshot_path.c_str());
}

} // namespace arbor
