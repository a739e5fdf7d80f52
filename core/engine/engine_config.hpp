#pragma once

#include "atomizer/atomizer.hpp"
#include "common/log.hpp"
#include "memory/lineage_store.hpp"
#include "observer/combiner.hpp"
#include "pipeline/pipeline_manager.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace arbor {

// ─── Engine Configuration ─────────────────────────────────────
// Every knob of the engine with its default. A JSON file only needs
// the keys it changes:
//
// {
//   "log_level": "info",
//   "atomizer":    {"strategy": "word", "base_weight": 0.01},
//   "importance":  {"window_size": 64, "keywords": ["alert"],
//                   "weights": {"repetition": 0.05}},
//   "interaction": {"aggregation": "sum", "invalidate_penalty": 0.2},
//   "mode":        {"collapse_threshold": 1.0, "max_iterations": 1000},
//   "pipeline":    {"max_live_contexts": 64},
//   "combiner":    {"parallel": true, "agreement_bonus": 0.1},
//   "store":       {"log_path": "arbor.log", "snapshot_path": "arbor.json"}
// }

struct EngineConfig {
    AtomizerConfig atomizer;
    PipelineConfig pipeline;     // pipeline.context holds mode/interaction/importance
    CombinerConfig combiner;
    StoreConfig store;
    LogLevel log_level = LogLevel::WARN;
};

/// Throws ConfigError on wrong types or out-of-range values.
EngineConfig engineConfigFromJson(const nlohmann::json& j);

/// Throws ConfigError when the file is unreadable or malformed.
EngineConfig loadEngineConfig(const std::string& path);

/// Range checks shared by the loader and the Engine constructor.
void validateEngineConfig(const EngineConfig& config);

} // namespace arbor
