#include "engine/engine_config.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <fstream>
#include <type_traits>

namespace arbor {

using json = nlohmann::json;

namespace {

template <typename T>
void readField(const json& section, const char* key, T& out, const std::string& where) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    // get<size_t>() would wrap a negative number to a huge count.
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (!it->is_number_unsigned()) {
            throw ConfigError(where + "." + key + " must be a non-negative integer");
        }
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(where + "." + key + ": " + e.what());
    }
}

const json* sectionOf(const json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) return nullptr;
    if (!it->is_object()) {
        throw ConfigError(std::string("section '") + key + "' must be an object");
    }
    return &*it;
}

void require(bool ok, const std::string& message) {
    if (!ok) throw ConfigError(message);
}

} // namespace

EngineConfig engineConfigFromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("engine config must be a JSON object");
    }
    EngineConfig cfg;
    ContextConfig& ctx = cfg.pipeline.context;

    if (j.contains("log_level")) {
        std::string level;
        readField(j, "log_level", level, "root");
        if (!parseLogLevel(level, cfg.log_level)) {
            throw ConfigError("unknown log_level '" + level + "'");
        }
    }

    if (const json* s = sectionOf(j, "atomizer")) {
        readField(*s, "strategy", cfg.atomizer.strategy, "atomizer");
        readField(*s, "base_weight", cfg.atomizer.base_weight, "atomizer");
        readField(*s, "max_units", cfg.atomizer.max_units, "atomizer");
        readField(*s, "max_input_bytes", cfg.atomizer.max_input_bytes, "atomizer");
    }

    if (const json* s = sectionOf(j, "importance")) {
        if (const json* w = sectionOf(*s, "weights")) {
            readField(*w, "repetition", ctx.importance.weights.repetition, "importance.weights");
            readField(*w, "keyword", ctx.importance.weights.keyword, "importance.weights");
            readField(*w, "urgency", ctx.importance.weights.urgency, "importance.weights");
            readField(*w, "position", ctx.importance.weights.position, "importance.weights");
        }
        readField(*s, "max_delta", ctx.importance.max_delta, "importance");
        readField(*s, "window_size", ctx.importance.window_size, "importance");
        readField(*s, "keywords", ctx.importance.keywords, "importance");
    }

    if (const json* s = sectionOf(j, "interaction")) {
        std::string aggregation;
        readField(*s, "aggregation", aggregation, "interaction");
        if (aggregation == "sum") {
            ctx.interaction.aggregation = Aggregation::SUM;
        } else if (aggregation == "max") {
            ctx.interaction.aggregation = Aggregation::MAX;
        } else if (!aggregation.empty()) {
            throw ConfigError("interaction.aggregation must be 'sum' or 'max'");
        }
        readField(*s, "invalidate_penalty", ctx.interaction.invalidate_penalty, "interaction");
    }

    if (const json* s = sectionOf(j, "mode")) {
        readField(*s, "collapse_threshold", ctx.mode.collapse_threshold, "mode");
        readField(*s, "max_iterations", ctx.mode.max_iterations, "mode");
        readField(*s, "max_seconds", ctx.mode.max_seconds, "mode");
    }

    if (const json* s = sectionOf(j, "pipeline")) {
        readField(*s, "max_live_contexts", cfg.pipeline.max_live_contexts, "pipeline");
        readField(*s, "archive_capacity", cfg.pipeline.archive_capacity, "pipeline");
    }

    if (const json* s = sectionOf(j, "combiner")) {
        readField(*s, "parallel", cfg.combiner.parallel, "combiner");
        readField(*s, "base_weight", cfg.combiner.base_weight, "combiner");
        readField(*s, "agreement_bonus", cfg.combiner.agreement_bonus, "combiner");
    }

    if (const json* s = sectionOf(j, "store")) {
        readField(*s, "log_path", cfg.store.log_path, "store");
        readField(*s, "snapshot_path", cfg.store.snapshot_path, "store");
    }

    validateEngineConfig(cfg);
    return cfg;
}

EngineConfig loadEngineConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config '" + path + "'");
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("config '" + path + "': " + e.what());
    }
    return engineConfigFromJson(j);
}

void validateEngineConfig(const EngineConfig& config) {
    const auto names = atomizeStrategyNames();
    require(std::find(names.begin(), names.end(), config.atomizer.strategy) != names.end(),
            "atomizer.strategy '" + config.atomizer.strategy + "' is unknown");
    require(config.atomizer.base_weight >= 0.0, "atomizer.base_weight must be >= 0");
    require(config.atomizer.max_units > 0, "atomizer.max_units must be > 0");
    require(config.atomizer.max_input_bytes > 0, "atomizer.max_input_bytes must be > 0");

    const ContextConfig& ctx = config.pipeline.context;
    require(ctx.importance.max_delta > 0.0, "importance.max_delta must be > 0");
    require(ctx.importance.weights.repetition > 0.0,
            "importance.weights.repetition must be > 0");
    require(ctx.importance.window_size > 0, "importance.window_size must be > 0");
    require(ctx.interaction.invalidate_penalty >= 0.0 &&
                ctx.interaction.invalidate_penalty < 1.0,
            "interaction.invalidate_penalty must be in [0, 1)");
    require(ctx.mode.collapse_threshold > 0.0, "mode.collapse_threshold must be > 0");
    require(ctx.mode.max_iterations > 0 || ctx.mode.max_seconds > 0.0,
            "mode needs an iteration or time budget");

    require(config.pipeline.max_live_contexts > 0, "pipeline.max_live_contexts must be > 0");
    require(config.pipeline.archive_capacity > 0, "pipeline.archive_capacity must be > 0");
    require(config.combiner.base_weight >= 0.0, "combiner.base_weight must be >= 0");
    require(config.combiner.agreement_bonus > 0.0, "combiner.agreement_bonus must be > 0");
}

} // namespace arbor
