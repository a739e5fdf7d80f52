#pragma once

#include <stdexcept>
#include <string>

namespace arbor {

// ─── Error Taxonomy ────────────────────────────────────────────
// Every failure raised by the library is an ArborError. Callers that
// only care about "did it work" catch the base; the engine and the
// pipeline catch specific types to decide between retry and discard.

class ArborError : public std::runtime_error {
public:
    explicit ArborError(const std::string& what) : std::runtime_error(what) {}
};

// ── Atomizer ──
class InvalidInputError : public ArborError {
public:
    explicit InvalidInputError(const std::string& what) : ArborError(what) {}
};

class ExhaustedInputError : public InvalidInputError {
public:
    explicit ExhaustedInputError(const std::string& what) : InvalidInputError(what) {}
};

// ── Interaction engine ──
class UnknownUnitError : public ArborError {
public:
    explicit UnknownUnitError(const std::string& what) : ArborError(what) {}
};

class UnknownGroupError : public ArborError {
public:
    explicit UnknownGroupError(const std::string& what) : ArborError(what) {}
};

class InvalidInteractionError : public ArborError {
public:
    explicit InvalidInteractionError(const std::string& what) : ArborError(what) {}
};

// ── Context lifecycle ──
class ContextFrozenError : public ArborError {
public:
    explicit ContextFrozenError(const std::string& what) : ArborError(what) {}
};

class ContextCancelledError : public ArborError {
public:
    explicit ContextCancelledError(const std::string& what) : ArborError(what) {}
};

class ContextNotResolvedError : public ArborError {
public:
    explicit ContextNotResolvedError(const std::string& what) : ArborError(what) {}
};

class NoSignalError : public ArborError {
public:
    explicit NoSignalError(const std::string& what) : ArborError(what) {}
};

// ── Pipeline manager ──
class CapacityExceededError : public ArborError {
public:
    explicit CapacityExceededError(const std::string& what) : ArborError(what) {}
};

class UnknownContextError : public ArborError {
public:
    explicit UnknownContextError(const std::string& what) : ArborError(what) {}
};

// ── Combiner ──
class InvalidObserverError : public ArborError {
public:
    explicit InvalidObserverError(const std::string& what) : ArborError(what) {}
};

class InvalidSymbolError : public ArborError {
public:
    explicit InvalidSymbolError(const std::string& what) : ArborError(what) {}
};

// ── Lineage store ──
class NotFoundError : public ArborError {
public:
    explicit NotFoundError(const std::string& what) : ArborError(what) {}
};

class InvalidLineageError : public ArborError {
public:
    explicit InvalidLineageError(const std::string& what) : ArborError(what) {}
};

class StoreIOError : public ArborError {
public:
    explicit StoreIOError(const std::string& what) : ArborError(what) {}
};

/// Raised when the single-writer guarantee of the store is broken.
/// Fatal: the store refuses every later write.
class WriteConflictError : public ArborError {
public:
    explicit WriteConflictError(const std::string& what) : ArborError(what) {}
};

// ── Configuration ──
class ConfigError : public ArborError {
public:
    explicit ConfigError(const std::string& what) : ArborError(what) {}
};

} // namespace arbor
