#include "importance/importance.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cctype>

namespace arbor {

namespace {

std::string lowered(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

double clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

} // namespace

// ─── ClippedWeightedSum ───────────────────────────────────────

double ClippedWeightedSum::compute(const InformationUnit& /*unit*/,
                                   const Signal& signal) const {
    double raw = weights_.repetition * std::max(0, signal.repetition_count) +
                 weights_.keyword * clamp01(signal.keyword_score) +
                 weights_.urgency * clamp01(signal.urgency) +
                 weights_.position * (1.0 - clamp01(signal.position));
    return std::min(max_delta_, std::max(0.0, raw));
}

// ─── RepetitionWindow ─────────────────────────────────────────

int RepetitionWindow::observe(const std::string& identity_key) {
    if (capacity_ == 0) return 1;
    if (order_.size() == capacity_) {
        const std::string& oldest = order_.front();
        auto it = counts_.find(oldest);
        if (it != counts_.end() && --it->second == 0) {
            counts_.erase(it);
        }
        order_.pop_front();
    }
    order_.push_back(identity_key);
    return ++counts_[identity_key];
}

int RepetitionWindow::count(const std::string& identity_key) const {
    auto it = counts_.find(identity_key);
    return it != counts_.end() ? it->second : 0;
}

// ─── ImportanceAssigner ───────────────────────────────────────

ImportanceAssigner::ImportanceAssigner(ImportanceConfig config)
    : ImportanceAssigner(config, std::make_shared<ClippedWeightedSum>(
                                     config.weights, config.max_delta)) {}

ImportanceAssigner::ImportanceAssigner(ImportanceConfig config,
                                       std::shared_ptr<const ImportanceStrategy> strategy)
    : config_(std::move(config)), strategy_(std::move(strategy)) {
    if (!strategy_) {
        throw ConfigError("importance assigner requires a strategy");
    }
    for (const auto& k : config_.keywords) {
        if (!k.empty()) lowered_keywords_.push_back(lowered(k));
    }
}

double ImportanceAssigner::assign(const InformationUnit& unit, const Signal& signal) const {
    return std::max(0.0, strategy_->compute(unit, signal));
}

double ImportanceAssigner::keywordScore(const InformationUnit& unit) const {
    if (lowered_keywords_.empty()) return 0.0;
    std::string value = lowered(unit.value());
    int hits = 0;
    for (const auto& k : lowered_keywords_) {
        if (value.find(k) != std::string::npos) hits++;
    }
    return static_cast<double>(hits) / lowered_keywords_.size();
}

} // namespace arbor
