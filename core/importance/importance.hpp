#pragma once

#include "unit/information_unit.hpp"

#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbor {

// ─── Signal ───────────────────────────────────────────────────
// Externally observable cues about one observation of a unit.

struct Signal {
    int repetition_count = 0;    // occurrences of the identity in the window
    double keyword_score = 0.0;  // [0, 1]
    double urgency = 0.0;        // [0, 1], caller-declared
    double position = 0.0;       // [0, 1], 0 = start of input
};

// ─── Importance Weights ───────────────────────────────────────

struct ImportanceWeights {
    double repetition = 0.05;
    double keyword    = 0.10;
    double urgency    = 0.10;
    double position   = 0.01;
};

struct ImportanceConfig {
    ImportanceWeights weights;
    double max_delta = 0.5;                 // per-observation clip
    size_t window_size = 64;                // repetition window length
    std::vector<std::string> keywords;      // matched case-insensitively
};

// ─── Importance Strategy ──────────────────────────────────────
// Abstract base for Δweight computation. Must be pure.

class ImportanceStrategy {
public:
    virtual ~ImportanceStrategy() = default;

    virtual std::string name() const = 0;

    /// Weight increase for one observation. Never negative.
    virtual double compute(const InformationUnit& unit, const Signal& signal) const = 0;
};

/// Δ = clamp(w_rep·rep + w_kw·kw + w_urg·urg + w_pos·(1 - pos), 0, max_delta)
/// Strictly increasing in repetition_count until the clip.
class ClippedWeightedSum : public ImportanceStrategy {
public:
    ClippedWeightedSum(ImportanceWeights weights, double max_delta)
        : weights_(weights), max_delta_(max_delta) {}

    std::string name() const override { return "clipped_weighted_sum"; }
    double compute(const InformationUnit& unit, const Signal& signal) const override;

private:
    ImportanceWeights weights_;
    double max_delta_;
};

// ─── Repetition Window ────────────────────────────────────────
// Sliding window over the last N observed identities of a context.

class RepetitionWindow {
public:
    explicit RepetitionWindow(size_t capacity = 64) : capacity_(capacity) {}

    /// Record an observation and return how often the identity now
    /// occurs in the window (>= 1).
    int observe(const std::string& identity_key);

    /// Occurrences of the identity without recording anything.
    int count(const std::string& identity_key) const;

    size_t size() const { return order_.size(); }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::deque<std::string> order_;
    std::unordered_map<std::string, int> counts_;
};

// ─── Importance Assigner ──────────────────────────────────────

class ImportanceAssigner {
public:
    explicit ImportanceAssigner(ImportanceConfig config = {});
    ImportanceAssigner(ImportanceConfig config, std::shared_ptr<const ImportanceStrategy> strategy);

    /// Δweight for one observation. Pure.
    double assign(const InformationUnit& unit, const Signal& signal) const;

    /// Fraction of configured keywords found in the unit value.
    double keywordScore(const InformationUnit& unit) const;

    const ImportanceConfig& config() const { return config_; }
    const ImportanceStrategy& strategy() const { return *strategy_; }

private:
    ImportanceConfig config_;
    std::shared_ptr<const ImportanceStrategy> strategy_;
    std::vector<std::string> lowered_keywords_;
};

} // namespace arbor
