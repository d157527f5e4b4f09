#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 *
 * `ordered_json` keeps keys in insertion order, which is the order frames
 * are expected to appear on the wire.
 */
using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;
