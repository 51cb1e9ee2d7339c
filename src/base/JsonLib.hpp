#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Engine API bodies and dashboard responses are `nlohmann::json`.
 */
using json = nlohmann::json;
