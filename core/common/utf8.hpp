#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace arbor {

/// True when `text` is well-formed UTF-8, judged by the same JSON encoder
/// that persists it. Anything this rejects cannot be stored losslessly.
inline bool isValidUtf8(const std::string& text) {
    try {
        (void)nlohmann::json(text).dump();
        return true;
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
}

} // namespace arbor
